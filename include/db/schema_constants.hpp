#pragma once

#include <string_view>

namespace sqlguard::db {

inline constexpr std::string_view kYes    = "YES";
inline constexpr std::string_view kYesLow = "yes";

inline constexpr char kDot = '.';

// Column positions shared by both backends' catalog queries
inline constexpr size_t kColSchema   = 0;
inline constexpr size_t kColTable    = 1;
inline constexpr size_t kColColumn   = 2;
inline constexpr size_t kColDataType = 3;
inline constexpr size_t kColNullable = 4;
inline constexpr size_t kCatalogColumns = 5;

inline constexpr size_t kPkColumns = 3;

} // namespace sqlguard::db
