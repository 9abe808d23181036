//
// Created by gregorian-rayne on 2/10/26.
//

#include "bfa/types.hpp"

#include <algorithm>
#include <numeric>

namespace bfa
{
    double FileAuthors::total_lines() const noexcept {
        return std::accumulate(authors.begin(), authors.end(), 0.0,
            [](const double sum, const AuthorLines& entry) {
                return sum + entry.lines;
            });
    }

    const AuthorLines* FileAuthors::find(const std::string_view author) const noexcept {
        const auto it = std::ranges::find(authors, author, &AuthorLines::author);
        return it != authors.end() ? &*it : nullptr;
    }

    void add_lines(std::vector<AuthorLines>& authors, const std::string_view author, const double lines) {
        if (const auto it = std::ranges::find(authors, author, &AuthorLines::author); it != authors.end()) {
            it->lines += lines;
            return;
        }
        authors.push_back({std::string(author), lines});
    }

    AuthorshipData make_authorship_data(FileAuthorship file_authorship, std::vector<std::string> errors) {
        AuthorshipData data;
        data.total_files = file_authorship.size();

        for (const auto& file : file_authorship) {
            for (const auto& [author, lines] : file.authors) {
                add_lines(data.total_authorship, author, lines);
            }
        }

        data.file_authorship = std::move(file_authorship);
        data.errors = std::move(errors);
        return data;
    }
}  // namespace bfa
