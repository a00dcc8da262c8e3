#include "schema.hpp"

#include <cassert>
#include <charconv>
#include <cmath>

#include "string.hpp"

namespace {
JsonValue issue(std::string path, std::string message)
{
    JsonObject obj;
    obj.emplace("path", JsonValue(std::move(path)));
    obj.emplace("message", JsonValue(std::move(message)));
    return JsonValue(std::move(obj));
}

std::optional<double> parseNumber(std::string_view str)
{
    str = httpTrim(str);
    if (str.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    const auto last = str.data() + str.size();
    const auto res = std::from_chars(str.data(), last, value);
    if (res.ec != std::errc() || res.ptr != last || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

bool isIntegral(double value)
{
    return std::isfinite(value) && std::floor(value) == value;
}

// Returns the (possibly coerced) value or the message of the type error
Result<JsonValue, std::string> checkType(
    const JsonValue& value, ObjectSchema::Type type, bool coerce)
{
    switch (type) {
    case ObjectSchema::Type::String:
        if (value.isString()) {
            return value;
        }
        return error(std::string("Expected string"));
    case ObjectSchema::Type::Number:
        if (value.isNumber()) {
            return value;
        }
        if (coerce && value.isString()) {
            if (const auto num = parseNumber(value.asString())) {
                return JsonValue(*num);
            }
        }
        return error(std::string("Expected number"));
    case ObjectSchema::Type::Integer:
        if (value.isNumber() && isIntegral(value.asNumber())) {
            return value;
        }
        if (coerce && value.isString()) {
            if (const auto num = parseNumber(value.asString()); num && isIntegral(*num)) {
                return JsonValue(*num);
            }
        }
        return error(std::string("Expected integer"));
    case ObjectSchema::Type::Boolean:
        if (value.isBool()) {
            return value;
        }
        if (coerce && value.isString()) {
            if (value.asString() == "true") {
                return JsonValue(true);
            } else if (value.asString() == "false") {
                return JsonValue(false);
            }
        }
        return error(std::string("Expected boolean"));
    default:
        assert(false && "Invalid Type");
        return error(std::string("Invalid type"));
    }
}

// Returns an error message if a constraint is violated
std::optional<std::string> checkConstraints(
    const ObjectSchema::Field& field, const JsonValue& value)
{
    if (field.minLength && value.isString() && value.asString().size() < *field.minLength) {
        if (!field.message.empty()) {
            return field.message;
        }
        return "Must contain at least " + std::to_string(*field.minLength) + " character(s)";
    }
    if (field.positive && value.isNumber() && !(value.asNumber() > 0.0)) {
        if (!field.message.empty()) {
            return field.message;
        }
        return "Must be greater than 0";
    }
    return std::nullopt;
}
}

JsonValue Schema::describe() const
{
    return JsonValue(JsonObject {});
}

ObjectSchema& ObjectSchema::add(std::string name, Type type)
{
    fields_.push_back(Field { std::move(name), type });
    return *this;
}

ObjectSchema& ObjectSchema::string(std::string name)
{
    return add(std::move(name), Type::String);
}

ObjectSchema& ObjectSchema::number(std::string name)
{
    return add(std::move(name), Type::Number);
}

ObjectSchema& ObjectSchema::integer(std::string name)
{
    return add(std::move(name), Type::Integer);
}

ObjectSchema& ObjectSchema::boolean(std::string name)
{
    return add(std::move(name), Type::Boolean);
}

ObjectSchema& ObjectSchema::optional()
{
    assert(!fields_.empty());
    fields_.back().required = false;
    return *this;
}

ObjectSchema& ObjectSchema::minLength(size_t length, std::string message)
{
    assert(!fields_.empty());
    fields_.back().minLength = length;
    fields_.back().message = std::move(message);
    return *this;
}

ObjectSchema& ObjectSchema::positive(std::string message)
{
    assert(!fields_.empty());
    fields_.back().positive = true;
    fields_.back().message = std::move(message);
    return *this;
}

ObjectSchema& ObjectSchema::coerce()
{
    coerce_ = true;
    return *this;
}

ObjectSchema& ObjectSchema::strict()
{
    strict_ = true;
    return *this;
}

const std::vector<ObjectSchema::Field>& ObjectSchema::fields() const
{
    return fields_;
}

Result<JsonValue, SchemaError> ObjectSchema::parse(const JsonValue& value) const
{
    JsonArray issues;
    if (!value.isObject()) {
        issues.push_back(issue("", "Expected object"));
        JsonObject detail;
        detail.emplace("issues", JsonValue(std::move(issues)));
        return error(SchemaError { JsonValue(std::move(detail)) });
    }

    JsonObject output;
    for (const auto& field : fields_) {
        const auto member = getMember(value, field.name);
        if (!member || member->isNull()) {
            if (field.required) {
                issues.push_back(issue(field.name, "Required"));
            }
            continue;
        }

        auto checked = checkType(*member, field.type, coerce_);
        if (!checked) {
            issues.push_back(issue(field.name, checked.error()));
            continue;
        }

        if (const auto violation = checkConstraints(field, *checked)) {
            issues.push_back(issue(field.name, *violation));
            continue;
        }

        output.emplace(field.name, std::move(*checked));
    }

    if (strict_) {
        for (const auto& [key, _] : value.asObject()) {
            bool declared = false;
            for (const auto& field : fields_) {
                if (field.name == key) {
                    declared = true;
                    break;
                }
            }
            if (!declared) {
                issues.push_back(issue(key, "Unrecognized key"));
            }
        }
    }

    if (!issues.empty()) {
        JsonObject detail;
        detail.emplace("issues", JsonValue(std::move(issues)));
        return error(SchemaError { JsonValue(std::move(detail)) });
    }
    return JsonValue(std::move(output));
}

JsonValue ObjectSchema::describe() const
{
    JsonObject properties;
    JsonArray required;
    for (const auto& field : fields_) {
        JsonObject prop;
        prop.emplace("type", JsonValue(std::string(toString(field.type))));
        if (field.minLength) {
            prop.emplace("minLength", JsonValue(static_cast<double>(*field.minLength)));
        }
        if (field.positive) {
            prop.emplace("minimum", JsonValue(0.0));
            prop.emplace("exclusiveMinimum", JsonValue(true));
        }
        properties.emplace(field.name, JsonValue(std::move(prop)));
        if (field.required) {
            required.push_back(JsonValue(field.name));
        }
    }

    JsonObject schema;
    schema.emplace("type", JsonValue(std::string("object")));
    schema.emplace("properties", JsonValue(std::move(properties)));
    if (!required.empty()) {
        schema.emplace("required", JsonValue(std::move(required)));
    }
    return JsonValue(std::move(schema));
}

std::shared_ptr<ObjectSchema> objectSchema()
{
    return std::make_shared<ObjectSchema>();
}

std::string_view toString(ObjectSchema::Type type)
{
    switch (type) {
    case ObjectSchema::Type::String:
        return "string";
    case ObjectSchema::Type::Number:
        return "number";
    case ObjectSchema::Type::Integer:
        return "integer";
    case ObjectSchema::Type::Boolean:
        return "boolean";
    default:
        return "invalid";
    }
}
