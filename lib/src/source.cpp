#include "source.hpp"

#include <array>

namespace rtlharvest::lib
{

    namespace
    {
        constexpr std::array<SourceKindInfo, 2> kSourceKinds{{
            {SourceKind::SystemVerilog, "systemverilog", ".sv"},
            {SourceKind::Verilog, "verilog", ".v"},
        }};
    } // namespace

    std::span<const SourceKindInfo> recognizedSourceKinds() noexcept
    {
        return kSourceKinds;
    }

    std::string_view sourceKindName(SourceKind kind) noexcept
    {
        for (const auto &info : kSourceKinds)
        {
            if (info.kind == kind)
            {
                return info.name;
            }
        }
        return "unknown";
    }

    std::string_view sourceKindExtension(SourceKind kind) noexcept
    {
        for (const auto &info : kSourceKinds)
        {
            if (info.kind == kind)
            {
                return info.extension;
            }
        }
        return {};
    }

    SourceKind sourceKindForPath(const std::filesystem::path &path)
    {
        const std::string extension = path.extension().string();
        for (const auto &info : kSourceKinds)
        {
            if (extension == info.extension)
            {
                return info.kind;
            }
        }
        return SourceKind::Unknown;
    }

} // namespace rtlharvest::lib
