/**
 * @file omics_file_types.h
 * @brief Resource kinds and file selectors of the omics storage API
 */

#ifndef KCENON_OMICS_TRANSFER_CORE_OMICS_FILE_TYPES_H
#define KCENON_OMICS_TRANSFER_CORE_OMICS_FILE_TYPES_H

#include <kcenon/omics_transfer/core/types.h>

#include <string>
#include <string_view>

namespace kcenon::omics_transfer {

/**
 * @brief Kind of remote resource holding the files
 */
enum class resource_kind {
    read_set,   ///< Sequence store read set
    reference,  ///< Reference store reference
};

/**
 * @brief Files of a read set
 */
enum class read_set_file {
    source1,
    source2,
    index,
};

/**
 * @brief Files of a reference
 */
enum class reference_file {
    source,
    index,
};

/**
 * @brief Source file formats accepted by read set uploads
 */
enum class read_set_file_type {
    fastq,
    bam,
    cram,
    ubam,
};

[[nodiscard]] constexpr auto to_string(resource_kind kind) -> const char* {
    switch (kind) {
        case resource_kind::read_set: return "READ_SET";
        case resource_kind::reference: return "REFERENCE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Lowercase file key as used by the metadata "files" map
 */
[[nodiscard]] constexpr auto to_string(read_set_file file) -> const char* {
    switch (file) {
        case read_set_file::source1: return "source1";
        case read_set_file::source2: return "source2";
        case read_set_file::index: return "index";
        default: return "unknown";
    }
}

/**
 * @brief Lowercase file key as used by the metadata "files" map
 */
[[nodiscard]] constexpr auto to_string(reference_file file) -> const char* {
    switch (file) {
        case reference_file::source: return "source";
        case reference_file::index: return "index";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto to_string(read_set_file_type type) -> const char* {
    switch (type) {
        case read_set_file_type::fastq: return "FASTQ";
        case read_set_file_type::bam: return "BAM";
        case read_set_file_type::cram: return "CRAM";
        case read_set_file_type::ubam: return "UBAM";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Check whether a read set of this type may omit the reference ARN
 */
[[nodiscard]] constexpr auto is_unlinked_file_type(read_set_file_type type) -> bool {
    return type == read_set_file_type::fastq || type == read_set_file_type::ubam;
}

/**
 * @brief Parse a read set file name, case-insensitive
 */
[[nodiscard]] auto parse_read_set_file(std::string_view name) -> result<read_set_file>;

/**
 * @brief Parse a reference file name, case-insensitive
 */
[[nodiscard]] auto parse_reference_file(std::string_view name) -> result<reference_file>;

/**
 * @brief Parse a read set file type, case-insensitive
 */
[[nodiscard]] auto parse_read_set_file_type(std::string_view name) -> result<read_set_file_type>;

/**
 * @brief Check that a file key is valid for the resource kind
 * @return The normalized lowercase key
 */
[[nodiscard]] auto normalize_file_key(resource_kind kind, std::string_view name)
    -> result<std::string>;

/**
 * @brief Identifies one remote resource
 */
struct resource_ref {
    resource_kind kind = resource_kind::read_set;
    std::string store_id;
    std::string resource_id;

    [[nodiscard]] auto operator==(const resource_ref& other) const -> bool = default;
};

}  // namespace kcenon::omics_transfer

#endif  // KCENON_OMICS_TRANSFER_CORE_OMICS_FILE_TYPES_H
