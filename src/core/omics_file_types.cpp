/**
 * @file omics_file_types.cpp
 * @brief Parsing of omics file selectors
 */

#include <kcenon/omics_transfer/core/omics_file_types.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace kcenon::omics_transfer {

namespace {

auto to_lower(std::string_view value) -> std::string {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

template <typename Enum, std::size_t N>
auto parse_enum(std::string_view name,
                const std::array<Enum, N>& values,
                const char* type_name) -> result<Enum> {
    auto lowered = to_lower(name);
    std::string allowed;
    for (auto value : values) {
        auto candidate = to_lower(to_string(value));
        if (candidate == lowered) {
            return value;
        }
        if (!allowed.empty()) allowed += ", ";
        allowed += to_string(value);
    }
    return unexpected(error{error_code::invalid_argument,
                            std::string(type_name) + " must be one of " + allowed});
}

constexpr std::array<read_set_file, 3> all_read_set_files = {
    read_set_file::source1, read_set_file::source2, read_set_file::index};

constexpr std::array<reference_file, 2> all_reference_files = {
    reference_file::source, reference_file::index};

constexpr std::array<read_set_file_type, 4> all_read_set_file_types = {
    read_set_file_type::fastq, read_set_file_type::bam,
    read_set_file_type::cram, read_set_file_type::ubam};

}  // namespace

auto parse_read_set_file(std::string_view name) -> result<read_set_file> {
    return parse_enum(name, all_read_set_files, "read_set_file");
}

auto parse_reference_file(std::string_view name) -> result<reference_file> {
    return parse_enum(name, all_reference_files, "reference_file");
}

auto parse_read_set_file_type(std::string_view name) -> result<read_set_file_type> {
    return parse_enum(name, all_read_set_file_types, "read_set_file_type");
}

auto normalize_file_key(resource_kind kind, std::string_view name) -> result<std::string> {
    if (kind == resource_kind::read_set) {
        auto parsed = parse_read_set_file(name);
        if (!parsed) {
            return unexpected(parsed.error());
        }
        return std::string(to_string(parsed.value()));
    }

    auto parsed = parse_reference_file(name);
    if (!parsed) {
        return unexpected(parsed.error());
    }
    return std::string(to_string(parsed.value()));
}

}  // namespace kcenon::omics_transfer
