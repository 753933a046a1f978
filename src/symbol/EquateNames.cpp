//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
/// @file
/// @brief Formatting and parsing of type-derived equate names.
/// @details A derived name has exactly three delimiter-separated fields: the
///          tag, the unsigned decimal type id, and the signed decimal value.
///          Parsing is strict; anything else is treated as a manually authored
///          name and yields no identity.
//
//===----------------------------------------------------------------------===//

#include "symbol/EquateNames.hpp"

#include <charconv>
#include <sstream>

namespace eqtab::symbol
{
namespace
{
struct DerivedFields
{
    std::string_view typeId;
    std::string_view value;
};

std::optional<DerivedFields> splitDerived(std::string_view name)
{
    if (!isDerivedEquateName(name))
        return std::nullopt;
    std::string_view rest = name.substr(kDataTypeTag.size() + kFormatDelimiter.size());
    const size_t sep = rest.find(kFormatDelimiter);
    if (sep == std::string_view::npos)
        return std::nullopt;
    DerivedFields fields{rest.substr(0, sep), rest.substr(sep + kFormatDelimiter.size())};
    if (fields.value.find(kFormatDelimiter) != std::string_view::npos)
        return std::nullopt;
    return fields;
}

template <typename T> std::optional<T> parseWhole(std::string_view text)
{
    if (text.empty())
        return std::nullopt;
    T out{};
    const char *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out);
    if (ec != std::errc() || ptr != end)
        return std::nullopt;
    return out;
}
} // namespace

std::string formatNameForEquate(program::TypeId typeId, int64_t value)
{
    std::string out(kDataTypeTag);
    out += kFormatDelimiter;
    out += std::to_string(typeId);
    out += kFormatDelimiter;
    out += std::to_string(value);
    return out;
}

std::string formatNameForEquateError(int64_t value)
{
    std::ostringstream os;
    os << "0x";
    if (value < 0)
        os << '-' << std::hex << (~static_cast<uint64_t>(value) + 1);
    else
        os << std::hex << value;
    os << ' ' << kErrorTag;
    return os.str();
}

bool isDerivedEquateName(std::string_view name) noexcept
{
    return name.size() > kDataTypeTag.size() &&
           name.substr(0, kDataTypeTag.size()) == kDataTypeTag &&
           name.substr(kDataTypeTag.size(), kFormatDelimiter.size()) == kFormatDelimiter;
}

std::optional<program::TypeId> typeIdFromEquateName(std::string_view name)
{
    auto fields = splitDerived(name);
    if (!fields || !parseWhole<int64_t>(fields->value))
        return std::nullopt;
    return parseWhole<program::TypeId>(fields->typeId);
}

std::optional<int64_t> valueFromEquateName(std::string_view name)
{
    auto fields = splitDerived(name);
    if (!fields || !parseWhole<program::TypeId>(fields->typeId))
        return std::nullopt;
    return parseWhole<int64_t>(fields->value);
}

} // namespace eqtab::symbol
