#ifndef RTLHARVEST_SOURCE_HPP
#define RTLHARVEST_SOURCE_HPP

#include <filesystem>
#include <span>
#include <string_view>

namespace rtlharvest::lib
{

    enum class SourceKind
    {
        SystemVerilog,
        Verilog,
        Unknown
    };

    struct SourceKindInfo
    {
        SourceKind kind;
        std::string_view name;
        std::string_view extension;
    };

    /// Dialects the pipeline knows how to classify, in scan order.
    std::span<const SourceKindInfo> recognizedSourceKinds() noexcept;

    std::string_view sourceKindName(SourceKind kind) noexcept;
    std::string_view sourceKindExtension(SourceKind kind) noexcept;

    /// Exact, case-sensitive match on the file extension.
    SourceKind sourceKindForPath(const std::filesystem::path &path);

    struct Candidate
    {
        std::filesystem::path path;
        SourceKind kind = SourceKind::Unknown;
    };

} // namespace rtlharvest::lib

#endif // RTLHARVEST_SOURCE_HPP
