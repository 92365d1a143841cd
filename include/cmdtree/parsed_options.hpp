#ifndef CMDTREE_PARSED_OPTIONS_HPP
#define CMDTREE_PARSED_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "option.hpp"

namespace cmdtree {

// Ordered identifier -> value mapping produced by the parser.
//
// Writes are keyed replace: an existing key keeps its position and takes the new value,
// a new key is appended. overlay() applies a list of pairs with the same rule, so the last
// writer for a key wins regardless of where the earlier value came from (flag, default or
// an earlier overlay entry).
class ParsedOptions {
public:
    using Entry = std::pair<std::string, OptionValue>;

    void set(const std::string& id, OptionValue value) {
        for (auto& e : entries_) {
            if (e.first == id) {
                e.second = std::move(value);
                return;
            }
        }
        entries_.emplace_back(id, std::move(value));
    }

    // Adds the value only if the key is not present yet.
    bool setDefault(const std::string& id, OptionValue value) {
        if (has(id)) return false;
        entries_.emplace_back(id, std::move(value));
        return true;
    }

    void overlay(const std::vector<Entry>& pairs) {
        for (const auto& [k, v] : pairs) set(k, v);
    }

    [[nodiscard]] bool has(const std::string& id) const { return find(id) != nullptr; }

    [[nodiscard]] const OptionValue* find(const std::string& id) const {
        for (const auto& e : entries_) {
            if (e.first == id) return &e.second;
        }
        return nullptr;
    }

    // True only for a boolean entry holding `true` (presence flags such as help/version).
    [[nodiscard]] bool isSet(const std::string& id) const {
        const auto* v = find(id);
        return v != nullptr && std::holds_alternative<bool>(*v) && std::get<bool>(*v);
    }

    // Typed lookup; returns `defaultValue` when the key is absent or holds another type.
    // Integer entries are widened for `double` and narrowed for other integral requests;
    // a value outside the range of the requested integral type yields `defaultValue`.
    template <typename T>
    T get(const std::string& id, T defaultValue = T()) const {
        const auto* v = find(id);
        if (!v) return defaultValue;
        if constexpr (std::is_same_v<T, bool>) {
            if (const auto* b = std::get_if<bool>(v)) return *b;
            return defaultValue;
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (const auto* s = std::get_if<std::string>(v)) return *s;
            return toString(*v);
        } else if constexpr (std::is_integral_v<T>) {
            const auto* i = std::get_if<std::int64_t>(v);
            if (!i || !fitsIn<T>(*i)) return defaultValue;
            return static_cast<T>(*i);
        } else if constexpr (std::is_floating_point_v<T>) {
            if (const auto* d = std::get_if<double>(v)) return static_cast<T>(*d);
            if (const auto* i = std::get_if<std::int64_t>(v)) return static_cast<T>(*i);
            return defaultValue;
        } else {
            static_assert(std::is_same_v<T, OptionValue>, "unsupported option value type");
            return *v;
        }
    }

    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

private:
    template <typename T>
    static bool fitsIn(std::int64_t value) {
        if constexpr (std::is_signed_v<T>) {
            return value >= static_cast<std::int64_t>(std::numeric_limits<T>::min()) &&
                   value <= static_cast<std::int64_t>(std::numeric_limits<T>::max());
        } else {
            return value >= 0 && static_cast<std::uint64_t>(value) <= std::numeric_limits<T>::max();
        }
    }

    std::vector<Entry> entries_;
};

} // namespace cmdtree

#endif // CMDTREE_PARSED_OPTIONS_HPP
