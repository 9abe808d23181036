//
// Created by gregorian-rayne on 2/12/26.
//

#include "bfa/ownership/ownership_resolver.hpp"

namespace bfa::ownership
{
    std::optional<std::string> resolve_owner(const FileAuthors& file) {
        if (file.total_lines() <= 0.0) {
            return std::nullopt;
        }

        const AuthorLines* primary = nullptr;
        double max_lines = 0.0;

        // Strictly greater: the first maximal contributor keeps a tie.
        for (const auto& entry : file.authors) {
            if (entry.lines > max_lines) {
                max_lines = entry.lines;
                primary = &entry;
            }
        }

        if (primary == nullptr) {
            return std::nullopt;
        }
        return primary->author;
    }

    FileOwnership resolve_ownership(const FileAuthorship& authorship) {
        FileOwnership ownership;
        ownership.reserve(authorship.size());

        for (const auto& file : authorship) {
            ownership.push_back({file.file, resolve_owner(file)});
        }

        return ownership;
    }
}  // namespace bfa::ownership
