#pragma once

#include <array>
#include <complex>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ranges>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace Verdict {

/**
 * @brief Runtime shape of a Value. Decides which branch of a rule applies.
 */
enum class Kind : uint8_t {
    Invalid = 0,  ///< Absent value (untyped null).
    String,       ///< Text, measured in code points.
    Int,          ///< Any signed integer width.
    Uint,         ///< Any unsigned integer width.
    Float,        ///< 32 or 64-bit floating point.
    Bool,
    Sequence,     ///< Dynamically sized container.
    Mapping,      ///< Associative container.
    Array,        ///< Fixed-size array.
    Pointer,      ///< Nullable reference; never dereferenced.
    Record,       ///< Structured record.
    Unsupported,  ///< Anything no rule knows how to check.
};

/**
 * @brief Borrowed text.
 */
struct Text {
    std::string_view data;
};

/**
 * @brief Any signed integer, widened.
 */
struct Int {
    int64_t value;
};

/**
 * @brief Any unsigned integer, widened.
 */
struct Uint {
    uint64_t value;
};

/**
 * @brief Any float, widened.
 */
struct Float {
    double value;
};

struct Bool {
    bool value;
};

/**
 * @brief Container reduced to its element count.
 */
struct Collection {
    Kind kind;
    std::size_t size;
};

/**
 * @brief Nullable reference reduced to its null flag.
 */
struct Reference {
    bool is_null;
};

/**
 * @brief Structured record. Carries nothing the rules can inspect.
 */
struct Record {};

/**
 * @brief Placeholder for values outside the supported kinds.
 */
struct Opaque {};

/// @cond INTERNAL
namespace detail {

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
struct is_smart_pointer : std::false_type {};

template <typename T, typename D>
struct is_smart_pointer<std::unique_ptr<T, D>> : std::true_type {};

template <typename T>
struct is_smart_pointer<std::shared_ptr<T>> : std::true_type {};

template <typename T>
struct is_std_array : std::false_type {};

template <typename T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};

template <typename T>
struct is_complex : std::false_type {};

template <typename T>
struct is_complex<std::complex<T>> : std::true_type {};

template <typename T>
concept StringLike =
    !std::is_pointer_v<T> && std::convertible_to<const T&, std::string_view>;

template <typename T>
concept MapLike = std::ranges::sized_range<const T> && requires {
    typename T::key_type;
    typename T::mapped_type;
};

template <typename T>
concept ObjectPointer =
    std::is_pointer_v<T> && !std::is_function_v<std::remove_pointer_t<T>>;

}  // namespace detail
/// @endcond

/**
 * @brief An arbitrary runtime value, normalised into a closed set of kinds.
 *
 * Numeric widths collapse on construction: every signed integer becomes
 * int64_t, every unsigned integer uint64_t and every float double. Strings
 * are borrowed, so a Value must not outlive the data it was built from.
 */
class Value {
   public:
    // Numeric alternatives are wrapped so that no alternative converts into
    // another; a visitor missing an arm does not compile.
    using Storage = std::variant<std::monostate, Text, Int, Uint, Float, Bool,
                                 Collection, Reference, Record, Opaque>;

    constexpr Value() = default;

    [[nodiscard]] static constexpr Value null() noexcept { return Value{}; }

    [[nodiscard]] static constexpr Value string(std::string_view s) noexcept {
        return Value{Text{s}};
    }

    [[nodiscard]] static constexpr Value integer(int64_t v) noexcept {
        return Value{Int{v}};
    }

    [[nodiscard]] static constexpr Value unsigned_integer(uint64_t v) noexcept {
        return Value{Uint{v}};
    }

    [[nodiscard]] static constexpr Value floating(double v) noexcept {
        return Value{Float{v}};
    }

    [[nodiscard]] static constexpr Value boolean(bool v) noexcept {
        return Value{Bool{v}};
    }

    [[nodiscard]] static constexpr Value sequence(std::size_t size) noexcept {
        return Value{Collection{Kind::Sequence, size}};
    }

    [[nodiscard]] static constexpr Value mapping(std::size_t size) noexcept {
        return Value{Collection{Kind::Mapping, size}};
    }

    [[nodiscard]] static constexpr Value array(std::size_t size) noexcept {
        return Value{Collection{Kind::Array, size}};
    }

    [[nodiscard]] static constexpr Value pointer(bool is_null) noexcept {
        return Value{Reference{is_null}};
    }

    [[nodiscard]] static constexpr Value record() noexcept {
        return Value{Record{}};
    }

    [[nodiscard]] static constexpr Value unsupported() noexcept {
        return Value{Opaque{}};
    }

    /**
     * @brief Normalises any C++ value into a Value.
     *
     * Pointers, optionals and smart pointers only contribute their null flag.
     * Containers only contribute their size. Class types that are not
     * containers, strings or references are records.
     *
     * A `const char*` is a pointer like any other, so `len` and `min` pass it
     * unchecked and `regexp` rejects it as unsupported. Wrap C strings in
     * std::string_view to validate them as text.
     *
     * @tparam T The caller's type.
     * @param v The value to inspect. Strings are borrowed from it.
     */
    template <typename T>
    [[nodiscard]] static constexpr Value of(const T& v) noexcept {
        using U = std::remove_cv_t<T>;
        if constexpr (std::same_as<U, Value>) {
            return v;
        } else if constexpr (std::same_as<U, std::nullptr_t> ||
                             std::same_as<U, std::monostate>) {
            return null();
        } else if constexpr (std::same_as<U, bool>) {
            return boolean(v);
        } else if constexpr (detail::StringLike<U>) {
            return string(std::string_view{v});
        } else if constexpr (std::is_enum_v<U>) {
            return of(static_cast<std::underlying_type_t<U>>(v));
        } else if constexpr (std::signed_integral<U>) {
            return integer(static_cast<int64_t>(v));
        } else if constexpr (std::unsigned_integral<U>) {
            return unsigned_integer(static_cast<uint64_t>(v));
        } else if constexpr (std::floating_point<U>) {
            return floating(static_cast<double>(v));
        } else if constexpr (detail::ObjectPointer<U>) {
            return pointer(v == nullptr);
        } else if constexpr (detail::is_optional<U>::value) {
            return pointer(!v.has_value());
        } else if constexpr (detail::is_smart_pointer<U>::value) {
            return pointer(v == nullptr);
        } else if constexpr (std::is_array_v<U>) {
            return array(std::extent_v<U>);
        } else if constexpr (detail::is_std_array<U>::value) {
            return array(v.size());
        } else if constexpr (detail::MapLike<U>) {
            return mapping(std::ranges::size(v));
        } else if constexpr (std::ranges::sized_range<const U>) {
            return sequence(std::ranges::size(v));
        } else if constexpr (detail::is_complex<U>::value ||
                             std::is_union_v<U>) {
            return unsupported();
        } else if constexpr (std::is_class_v<U>) {
            return record();
        } else {
            // Function and member pointers.
            return unsupported();
        }
    }

    [[nodiscard]] constexpr Kind kind() const noexcept {
        return std::visit(
            [](const auto& alt) -> Kind {
                using A = std::decay_t<decltype(alt)>;
                if constexpr (std::same_as<A, std::monostate>) {
                    return Kind::Invalid;
                } else if constexpr (std::same_as<A, Text>) {
                    return Kind::String;
                } else if constexpr (std::same_as<A, Int>) {
                    return Kind::Int;
                } else if constexpr (std::same_as<A, Uint>) {
                    return Kind::Uint;
                } else if constexpr (std::same_as<A, Float>) {
                    return Kind::Float;
                } else if constexpr (std::same_as<A, Bool>) {
                    return Kind::Bool;
                } else if constexpr (std::same_as<A, Collection>) {
                    return alt.kind;
                } else if constexpr (std::same_as<A, Reference>) {
                    return Kind::Pointer;
                } else if constexpr (std::same_as<A, Record>) {
                    return Kind::Record;
                } else {
                    static_assert(std::same_as<A, Opaque>);
                    return Kind::Unsupported;
                }
            },
            storage_);
    }

    /**
     * @brief Returns the alternative if the value holds an A, else nullptr.
     */
    template <typename A>
    [[nodiscard]] constexpr const A* get_if() const noexcept {
        return std::get_if<A>(&storage_);
    }

    /**
     * @brief Applies a visitor to the underlying alternative.
     *
     * Validators pass an overload set with one arm per alternative so that a
     * new kind fails to compile until every rule handles it.
     */
    template <typename Visitor>
    constexpr decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), storage_);
    }

   private:
    template <typename A>
        requires(!std::same_as<A, Value>)
    constexpr explicit Value(A alt) noexcept
        : storage_(std::in_place_type<A>, alt) {}

    Storage storage_{};
};

/**
 * @brief Human-readable name of a kind, for diagnostics.
 */
[[nodiscard]] constexpr std::string_view KindName(Kind kind) noexcept {
    switch (kind) {
        case Kind::Invalid:
            return "invalid";
        case Kind::String:
            return "string";
        case Kind::Int:
            return "int";
        case Kind::Uint:
            return "uint";
        case Kind::Float:
            return "float";
        case Kind::Bool:
            return "bool";
        case Kind::Sequence:
            return "sequence";
        case Kind::Mapping:
            return "mapping";
        case Kind::Array:
            return "array";
        case Kind::Pointer:
            return "pointer";
        case Kind::Record:
            return "record";
        case Kind::Unsupported:
            return "unsupported";
    }
    return "unknown";
}

/**
 * @brief Builds an overload set out of lambdas for Value::visit.
 */
template <typename... Fs>
struct Overloaded : Fs... {
    using Fs::operator()...;
};

template <typename... Fs>
Overloaded(Fs...) -> Overloaded<Fs...>;

}  // namespace Verdict
