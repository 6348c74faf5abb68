#include "output.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <system_error>

namespace rtlharvest::lib::output
{

    namespace
    {
        constexpr std::string_view kLetters = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";

        bool safeChar(char c)
        {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                   c == '_' || c == '$' || c == '.' || c == '-';
        }

        struct FileCloser
        {
            void operator()(std::FILE *file) const noexcept
            {
                if (file != nullptr)
                {
                    std::fclose(file);
                }
            }
        };
    } // namespace

    std::string sanitizeFileName(std::string_view name)
    {
        std::string out;
        out.reserve(name.size());
        for (char c : name)
        {
            out.push_back(safeChar(c) ? c : '_');
        }
        if (out.empty() || out == "." || out == "..")
        {
            return "_";
        }
        return out;
    }

    OutputDirectory::OutputDirectory(std::filesystem::path root)
        : OutputDirectory(std::move(root), std::random_device{}())
    {
    }

    OutputDirectory::OutputDirectory(std::filesystem::path root, std::uint64_t seed)
        : root_(std::move(root)), rng_(seed)
    {
    }

    OutputResult OutputDirectory::prepare() const
    {
        OutputResult result;
        std::error_code ec;
        std::filesystem::create_directories(root_, ec);
        if (ec)
        {
            result.success = false;
            result.error = "cannot create output directory " + root_.string() + ": " + ec.message();
            return result;
        }
        if (!std::filesystem::is_directory(root_, ec))
        {
            result.success = false;
            result.error = "output path is not a directory: " + root_.string();
        }
        return result;
    }

    std::string OutputDirectory::randomPrefix()
    {
        std::uniform_int_distribution<std::size_t> pick(0, kLetters.size() - 1);
        std::string prefix;
        prefix.reserve(kPrefixLength + 1);
        for (std::size_t i = 0; i < kPrefixLength; ++i)
        {
            prefix.push_back(kLetters[pick(rng_)]);
        }
        prefix.push_back('_');
        return prefix;
    }

    bool OutputDirectory::taken(const std::filesystem::path &path) const
    {
        if (reserved_.count(path) != 0)
        {
            return true;
        }
        std::error_code ec;
        return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
    }

    std::filesystem::path OutputDirectory::reserve(std::string_view desiredName)
    {
        const std::string name = sanitizeFileName(desiredName);
        std::filesystem::path path = root_ / name;
        while (taken(path))
        {
            ++collisions_;
            path = root_ / (randomPrefix() + name);
        }
        reserved_.insert(path);
        return path;
    }

    OutputResult OutputDirectory::write(const std::filesystem::path &path, std::string_view text) const
    {
        OutputResult result;
        // "x": fail if the file already exists.
        std::unique_ptr<std::FILE, FileCloser> file(std::fopen(path.c_str(), "wbx"));
        if (!file)
        {
            result.success = false;
            result.error = "cannot create " + path.string() + ": " + std::strerror(errno);
            return result;
        }
        if (!text.empty() && std::fwrite(text.data(), 1, text.size(), file.get()) != text.size())
        {
            result.success = false;
            result.error = "short write to " + path.string() + ": " + std::strerror(errno);
        }
        if (std::fclose(file.release()) != 0 && result.success)
        {
            result.success = false;
            result.error = "cannot close " + path.string() + ": " + std::strerror(errno);
        }
        if (!result.success)
        {
            // Only a file created by this call gets here.
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
            {
                result.error.append("; cannot remove partial file: " + ec.message());
            }
        }
        return result;
    }

    OutputResult OutputDirectory::remove(const std::filesystem::path &path) const
    {
        OutputResult result;
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec)
        {
            result.success = false;
            result.error = "cannot remove " + path.string() + ": " + ec.message();
        }
        return result;
    }

} // namespace rtlharvest::lib::output
