#include "productstore.hpp"

#include <algorithm>
#include <iterator>

#include "string.hpp"

JsonValue Product::toJson() const
{
    JsonObject obj;
    obj.emplace("id", JsonValue(static_cast<double>(id)));
    obj.emplace("name", JsonValue(name));
    obj.emplace("price", JsonValue(price));
    obj.emplace("featured", JsonValue(featured));
    return JsonValue(std::move(obj));
}

ProductStore::ProductStore()
{
    add("Classic Burger", 8.5);
    add("Cheese Burger", 9.5).featured = true;
    add("Veggie Burger", 9.0);
    add("Fries", 3.5);
}

std::vector<Product> ProductStore::list(std::string_view search) const
{
    if (search.empty()) {
        return products_;
    }
    const auto needle = toLower(search);
    std::vector<Product> ret;
    for (const auto& product : products_) {
        if (toLower(product.name).find(needle) != std::string::npos) {
            ret.push_back(product);
        }
    }
    return ret;
}

std::vector<Product> ProductStore::featured() const
{
    std::vector<Product> ret;
    std::copy_if(products_.begin(), products_.end(), std::back_inserter(ret),
        [](const Product& product) { return product.featured; });
    return ret;
}

std::optional<Product> ProductStore::find(int64_t id) const
{
    for (const auto& product : products_) {
        if (product.id == id) {
            return product;
        }
    }
    return std::nullopt;
}

Product& ProductStore::add(std::string name, double price)
{
    return products_.emplace_back(Product { nextId_++, std::move(name), price });
}

bool ProductStore::update(int64_t id, std::string name, double price)
{
    for (auto& product : products_) {
        if (product.id == id) {
            product.name = std::move(name);
            product.price = price;
            return true;
        }
    }
    return false;
}

bool ProductStore::remove(int64_t id)
{
    const auto it = std::find_if(products_.begin(), products_.end(),
        [id](const Product& product) { return product.id == id; });
    if (it == products_.end()) {
        return false;
    }
    products_.erase(it);
    return true;
}

ProductStore& ProductStore::getDefault()
{
    static ProductStore store;
    return store;
}

JsonValue toJson(const std::vector<Product>& products)
{
    JsonArray arr;
    for (const auto& product : products) {
        arr.push_back(product.toJson());
    }
    return JsonValue(std::move(arr));
}
