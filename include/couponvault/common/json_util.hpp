#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace couponvault::common {

[[nodiscard]] std::string json_escape(const std::string &value);

[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

[[nodiscard]] std::optional<std::string> json_get_string(const std::string &json,
                                                         const std::string &field);

// Fractions are truncated.
[[nodiscard]] std::optional<std::int64_t> json_get_int(const std::string &json,
                                                       const std::string &field);

[[nodiscard]] std::optional<bool> json_get_bool(const std::string &json, const std::string &field);

[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

} // namespace couponvault::common
