#ifndef JSTREAM_JSON_DECODER_REGISTRY_H
#define JSTREAM_JSON_DECODER_REGISTRY_H

#include <cstddef>
#include <memory>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

#include "DecodePlan.h"

namespace jstream::json {

// Type-keyed lookup of decode plans. Passed explicitly to the streams that use
// it; populate it before streaming starts.
class DecoderRegistry {
public:
    DecoderRegistry() = default;

    // Replaces any plan already registered for T.
    template <typename T>
    void register_plan(DecodePlanPtr<T> plan) {
        bool replaced = plans_.contains(std::type_index(typeid(T)));
        plans_.insert_or_assign(std::type_index(typeid(T)), std::shared_ptr<const void>(std::move(plan)));
        on_registered(typeid(T), replaced);
    }

    // The plan registered for T, or null.
    template <typename T>
    [[nodiscard]] DecodePlanPtr<T> lookup() const {
        auto it = plans_.find(std::type_index(typeid(T)));
        if (it == plans_.end()) {
            return nullptr;
        }
        return std::static_pointer_cast<const DecodePlan<T>>(it->second);
    }

    template <typename T>
    [[nodiscard]] bool contains() const {
        return plans_.contains(std::type_index(typeid(T)));
    }

    template <typename T>
    bool erase() {
        return plans_.erase(std::type_index(typeid(T))) > 0;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return plans_.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return plans_.empty();
    }

    void clear();

private:
    void on_registered(const std::type_info &type, bool replaced) const;

    std::unordered_map<std::type_index, std::shared_ptr<const void>> plans_;
};

class DecoderRegistryBuilder {
public:
    template <typename T>
    DecoderRegistryBuilder &add(DecodePlanPtr<T> plan) {
        registry_.register_plan<T>(std::move(plan));
        return *this;
    }

    [[nodiscard]] DecoderRegistry build() {
        return std::move(registry_);
    }

private:
    DecoderRegistry registry_;
};

} // namespace jstream::json

#endif // JSTREAM_JSON_DECODER_REGISTRY_H
