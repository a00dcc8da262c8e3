#define TEST_DEFINE_MAIN
#include "test.hpp"
