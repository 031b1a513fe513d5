#pragma once
/*
===============================================================================
ENUM UTILS — Compile-time enumeration utilities for flipset
===============================================================================

OVERVIEW
--------
Declares strongly-typed enumerations with a COUNT sentinel and derives two
small tools from that convention:

• DECLARE_ENUM_WITH_COUNT: enum class + <Name>_COUNT constant
• EnumSet<Enum>: fixed-size flag set indexed by enumerators (used for
  solver backend capabilities)
• EnumNames<Enum>: enumerator <-> string table (used for option values that
  arrive as strings, e.g. "max" or "distinct_subsets")

USAGE EXAMPLES
--------------
    DECLARE_ENUM_WITH_COUNT(Capability, IncrementalConstraints, RhsMutation);

    EnumSet<Capability> caps{Capability::RhsMutation};
    caps.contains(Capability::RhsMutation);           // true

    constexpr EnumNames<Mode> kModeNames{{"fast", "slow"}};
    kModeNames.name(Mode::Fast);                      // "fast"
    kModeNames.parse("slow");                         // Mode::Slow

THREAD SAFETY
-------------
• EnumSet and EnumNames are value types without shared state

EXCEPTION SAFETY
----------------
• EnumNames::name() / parse() throw std::invalid_argument on unknown input
• Everything else is noexcept

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * @macro DECLARE_ENUM_WITH_COUNT
 * @brief Declares an enum class with a trailing COUNT sentinel
 *
 * @details Expands to:
 *     enum class Name { ..., COUNT };
 *     static constexpr std::size_t Name_COUNT = <number of enumerators>;
 *
 * @warning Do not declare COUNT yourself; values are sequential from 0.
 */
#define DECLARE_ENUM_WITH_COUNT(Name, ...)                                \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace flipset {

    /**
     * @brief Compile-time enumeration size trait
     *
     * @details Primary template assumes the COUNT sentinel convention.
     */
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    /// @brief True if value is a user enumerator (not COUNT, not out of range)
    template<typename Enum>
    constexpr bool is_valid_enum_value(Enum value) noexcept {
        return static_cast<std::size_t>(value) < enum_size<Enum>::value;
    }

    // ========================================================================
    // ENUM SET
    // ========================================================================

    /**
     * @class EnumSet
     * @brief Fixed-size set of enumerators, one flag per enumerator
     *
     * @tparam Enum Enumeration declared with DECLARE_ENUM_WITH_COUNT
     *
     * @example
     *     EnumSet<Capability> all = EnumSet<Capability>::full();
     *     EnumSet<Capability> none;
     *     none.insert(Capability::RhsMutation);
     */
    template<typename Enum>
    class EnumSet {
    private:
        std::array<bool, enum_size<Enum>::value> flags_{};

    public:
        constexpr EnumSet() noexcept = default;

        constexpr EnumSet(std::initializer_list<Enum> values) noexcept {
            for (Enum e : values) insert(e);
        }

        /// @brief Set containing every enumerator
        static constexpr EnumSet full() noexcept {
            EnumSet s;
            for (auto& f : s.flags_) f = true;
            return s;
        }

        constexpr void insert(Enum e) noexcept {
            if (is_valid_enum_value(e)) flags_[static_cast<std::size_t>(e)] = true;
        }

        constexpr void erase(Enum e) noexcept {
            if (is_valid_enum_value(e)) flags_[static_cast<std::size_t>(e)] = false;
        }

        [[nodiscard]] constexpr bool contains(Enum e) const noexcept {
            return is_valid_enum_value(e) && flags_[static_cast<std::size_t>(e)];
        }

        [[nodiscard]] constexpr std::size_t size() const noexcept {
            std::size_t n = 0;
            for (bool f : flags_) n += f ? 1 : 0;
            return n;
        }

        [[nodiscard]] constexpr bool empty() const noexcept { return size() == 0; }

        constexpr bool operator==(const EnumSet&) const noexcept = default;
    };

    // ========================================================================
    // ENUM NAMES
    // ========================================================================

    /**
     * @class EnumNames
     * @brief Bidirectional enumerator/string table
     *
     * @details Names are stored in enumerator order. The table must list one
     *          name per enumerator; this is checked when constructed in a
     *          constant expression.
     */
    template<typename Enum>
    class EnumNames {
    private:
        std::array<std::string_view, enum_size<Enum>::value> names_;

    public:
        constexpr explicit EnumNames(
            std::array<std::string_view, enum_size<Enum>::value> names) noexcept
            : names_(names) {}

        /// @throws std::invalid_argument for COUNT or out-of-range values
        [[nodiscard]] std::string name(Enum e) const {
            if (!is_valid_enum_value(e)) {
                throw std::invalid_argument(std::format(
                    "EnumNames::name: value {} out of range [0, {})",
                    static_cast<std::size_t>(e), enum_size<Enum>::value));
            }
            return std::string(names_[static_cast<std::size_t>(e)]);
        }

        /// @throws std::invalid_argument if text matches no enumerator
        [[nodiscard]] Enum parse(std::string_view text) const {
            for (std::size_t i = 0; i < names_.size(); ++i) {
                if (names_[i] == text) return static_cast<Enum>(i);
            }
            std::string valid;
            for (auto n : names_) {
                if (!valid.empty()) valid += ", ";
                valid += n;
            }
            throw std::invalid_argument(std::format(
                "EnumNames::parse: '{}' is not one of {{{}}}", text, valid));
        }
    };

} // namespace flipset
