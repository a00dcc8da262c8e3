#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "json.hpp"

struct Product {
    int64_t id;
    std::string name;
    double price;
    bool featured = false;

    JsonValue toJson() const;
};

// In-memory products of the example shop. Requests are dispatched on a single thread.
class ProductStore {
public:
    ProductStore();

    std::vector<Product> list(std::string_view search = "") const;
    std::vector<Product> featured() const;
    std::optional<Product> find(int64_t id) const;

    Product& add(std::string name, double price);
    bool update(int64_t id, std::string name, double price);
    bool remove(int64_t id);

    static ProductStore& getDefault();

private:
    std::vector<Product> products_;
    int64_t nextId_ = 1;
};

JsonValue toJson(const std::vector<Product>& products);
