#include "flatten.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>
#include <system_error>
#include <unordered_map>
#include <unordered_set>

namespace rtlharvest::lib::flatten
{

    namespace
    {
        const std::regex &includePattern()
        {
            static const std::regex pattern(R"re(`include\s+(?:"([\w./]+)"|<([\w./]+)>))re");
            return pattern;
        }

        std::string targetOf(const std::smatch &match)
        {
            return match[1].matched ? match[1].str() : match[2].str();
        }

        class TargetCache
        {
        public:
            explicit TargetCache(std::filesystem::path baseDirectory)
                : baseDirectory_(std::move(baseDirectory))
            {
            }

            const std::optional<std::string> &lookup(const std::string &target)
            {
                auto it = cache_.find(target);
                if (it != cache_.end())
                {
                    return it->second;
                }
                const std::filesystem::path relative(target);
                std::optional<std::string> contents;
                if (!relative.is_absolute())
                {
                    contents = readSourceFile(baseDirectory_ / relative);
                }
                return cache_.emplace(target, std::move(contents)).first->second;
            }

        private:
            std::filesystem::path baseDirectory_;
            std::unordered_map<std::string, std::optional<std::string>> cache_;
        };

        std::string substituteOnce(const std::string &text, TargetCache &cache,
                                   std::vector<std::string> &dropped, std::unordered_set<std::string> &droppedSeen)
        {
            std::string out;
            out.reserve(text.size());
            auto last = text.cbegin();
            for (std::sregex_iterator it(text.begin(), text.end(), includePattern()), end; it != end; ++it)
            {
                const std::smatch &match = *it;
                out.append(last, match[0].first);
                last = match[0].second;

                const std::string target = targetOf(match);
                const auto &contents = cache.lookup(target);
                if (contents)
                {
                    out.append(*contents);
                }
                else if (droppedSeen.insert(target).second)
                {
                    dropped.push_back(target);
                }
            }
            out.append(last, text.cend());
            return out;
        }
    } // namespace

    std::optional<std::string> readSourceFile(const std::filesystem::path &path)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec) || ec)
        {
            return std::nullopt;
        }
        std::ifstream stream(path, std::ios::in | std::ios::binary);
        if (!stream.is_open())
        {
            return std::nullopt;
        }
        std::ostringstream buffer;
        buffer << stream.rdbuf();
        if (stream.bad())
        {
            return std::nullopt;
        }
        return buffer.str();
    }

    std::size_t countIncludeDirectives(std::string_view text)
    {
        const std::string owned(text);
        return static_cast<std::size_t>(
            std::distance(std::sregex_iterator(owned.begin(), owned.end(), includePattern()), std::sregex_iterator()));
    }

    IncludeFlattener::IncludeFlattener(FlattenOptions options)
        : options_(options)
    {
    }

    FlattenResult IncludeFlattener::flatten(const std::filesystem::path &rootFile) const
    {
        auto contents = readSourceFile(rootFile);
        if (!contents)
        {
            FlattenResult result;
            result.success = false;
            result.complete = false;
            result.error = "cannot read " + rootFile.string();
            return result;
        }
        return flattenText(std::move(*contents), rootFile.parent_path());
    }

    FlattenResult IncludeFlattener::flattenText(std::string text, const std::filesystem::path &baseDirectory) const
    {
        FlattenResult result;
        TargetCache cache(baseDirectory);
        std::unordered_set<std::string> droppedSeen;

        const int maxPasses = std::max(options_.maxPasses, 0);
        while (result.passes < maxPasses && std::regex_search(text, includePattern()))
        {
            text = substituteOnce(text, cache, result.droppedTargets, droppedSeen);
            ++result.passes;
        }

        result.complete = !std::regex_search(text, includePattern());
        result.text = std::move(text);
        return result;
    }

} // namespace rtlharvest::lib::flatten
