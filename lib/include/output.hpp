#ifndef RTLHARVEST_OUTPUT_HPP
#define RTLHARVEST_OUTPUT_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <set>
#include <string>
#include <string_view>

namespace rtlharvest::lib::output
{

    inline constexpr std::size_t kPrefixLength = 5;

    struct OutputResult
    {
        bool success = true;
        std::string error;
    };

    /// Reduces a desired name to one safe path component. Characters outside
    /// [A-Za-z0-9_$.-] become '_'; empty, "." and ".." become "_".
    std::string sanitizeFileName(std::string_view name);

    /// The flat directory that accumulates accepted modules for a whole run.
    ///
    /// reserve() never hands out a path twice and never one that exists when
    /// it returns. Existence is checked, not locked: callers must serialize
    /// reserve() and write() if the directory is ever shared between threads.
    class OutputDirectory
    {
    public:
        explicit OutputDirectory(std::filesystem::path root);
        OutputDirectory(std::filesystem::path root, std::uint64_t seed);

        /// Creates the directory (and parents) when missing.
        OutputResult prepare() const;

        /// `root / name`, or `root / (prefix + "_" + name)` with a random
        /// alphabetic prefix when that is taken. Retries until free.
        std::filesystem::path reserve(std::string_view desiredName);

        /// Writes a new file; fails instead of replacing an existing one.
        /// A file this call created is deleted again when the write fails;
        /// a file that already existed is never touched.
        OutputResult write(const std::filesystem::path &path, std::string_view text) const;
        OutputResult remove(const std::filesystem::path &path) const;

        const std::filesystem::path &root() const noexcept { return root_; }
        std::size_t collisions() const noexcept { return collisions_; }

    private:
        std::string randomPrefix();
        bool taken(const std::filesystem::path &path) const;

        std::filesystem::path root_;
        std::mt19937_64 rng_;
        std::set<std::filesystem::path> reserved_;
        std::size_t collisions_ = 0;
    };

} // namespace rtlharvest::lib::output

#endif // RTLHARVEST_OUTPUT_HPP
