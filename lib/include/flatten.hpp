#ifndef RTLHARVEST_FLATTEN_HPP
#define RTLHARVEST_FLATTEN_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rtlharvest::lib::flatten
{

    inline constexpr int kDefaultMaxPasses = 5;

    struct FlattenOptions
    {
        int maxPasses = kDefaultMaxPasses;
    };

    struct FlattenResult
    {
        // False only when the root file itself could not be read.
        bool success = true;
        std::string text;
        int passes = 0;
        // False when directives were still present after the last allowed pass.
        bool complete = true;
        // Include targets that were missing or unreadable and got dropped.
        std::vector<std::string> droppedTargets;
        std::string error;
    };

    /// Reads a whole regular file; nullopt if it is missing or unreadable.
    std::optional<std::string> readSourceFile(const std::filesystem::path &path);

    std::size_t countIncludeDirectives(std::string_view text);

    /// Inlines `include "file"` and `include <file>` directives by textual
    /// substitution. This is a line pattern, not a preprocessor: directives
    /// inside comments or inactive `ifdef branches are substituted too.
    ///
    /// Every target is resolved against the root file's directory, whichever
    /// file the directive came from. Targets that do not exist, cannot be read
    /// or are absolute paths are replaced with nothing. Each pass rewrites all
    /// directives present in the text; at most maxPasses passes run, so cyclic
    /// includes terminate with the directives of the last pass left in place.
    class IncludeFlattener
    {
    public:
        explicit IncludeFlattener(FlattenOptions options = FlattenOptions());

        FlattenResult flatten(const std::filesystem::path &rootFile) const;
        FlattenResult flattenText(std::string text, const std::filesystem::path &baseDirectory) const;

        const FlattenOptions &options() const noexcept { return options_; }

    private:
        FlattenOptions options_;
    };

} // namespace rtlharvest::lib::flatten

#endif // RTLHARVEST_FLATTEN_HPP
