#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "json.hpp"
#include "result.hpp"

// Structured failure detail of a schema, reported verbatim in a 400 response
struct SchemaError {
    JsonValue detail;
};

// The only thing routing needs from a validator is parse. describe() feeds the OpenAPI document.
class Schema {
public:
    virtual ~Schema() = default;

    // Returns the parsed (and possibly coerced) value or a structured error
    virtual Result<JsonValue, SchemaError> parse(const JsonValue& value) const = 0;

    // JSON Schema of the accepted values. The default accepts anything.
    virtual JsonValue describe() const;
};

class ObjectSchema : public Schema {
public:
    enum class Type { String, Number, Integer, Boolean };

    struct Field {
        std::string name;
        Type type;
        bool required = true;
        std::optional<size_t> minLength = std::nullopt;
        bool positive = false;
        std::string message = ""; // custom message for a failed constraint
    };

    ObjectSchema() = default;

    ObjectSchema& string(std::string name);
    ObjectSchema& number(std::string name);
    ObjectSchema& integer(std::string name);
    ObjectSchema& boolean(std::string name);

    // Modify the field that was added last
    ObjectSchema& optional();
    ObjectSchema& minLength(size_t length, std::string message = "");
    ObjectSchema& positive(std::string message = "");

    // Strings are converted to the field type before checking. Path parameters and query
    // strings only ever contain strings, so their schemas usually want this.
    ObjectSchema& coerce();

    // Keys that are not declared are rejected instead of being dropped from the output
    ObjectSchema& strict();

    const std::vector<Field>& fields() const;

    Result<JsonValue, SchemaError> parse(const JsonValue& value) const override;
    JsonValue describe() const override;

private:
    ObjectSchema& add(std::string name, Type type);

    std::vector<Field> fields_;
    bool coerce_ = false;
    bool strict_ = false;
};

std::shared_ptr<ObjectSchema> objectSchema();

std::string_view toString(ObjectSchema::Type type);

// The validators of one method of a route. Unset validators are skipped.
struct MethodSchema {
    std::shared_ptr<const Schema> params;
    std::shared_ptr<const Schema> query;
    std::shared_ptr<const Schema> body;

    bool empty() const { return !params && !query && !body; }
};
