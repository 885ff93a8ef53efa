/*
 * DomainSentry - Secure Web Gateway Categorization Engine
 * Copyright (C) 2026 DomainSentry Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * @file BlockPage.hpp
 * @brief HTML served in place of a blocked destination.
 *
 * The template may contain {{domain}} and {{category}} placeholders; both are
 * HTML-escaped on substitution.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <filesystem>

namespace DomainSentry {
namespace Gateway {

namespace BlockPageConstants {

    inline constexpr const char* DEFAULT_FILE = "block_page.html";

    inline constexpr const char* FALLBACK_HTML = "<h1>Access Denied!</h1><p>Blocked by filter.</p>";

    inline constexpr uint32_t STATUS_CODE = 403;

    inline constexpr const char* CONTENT_TYPE = "text/html";

}  // namespace BlockPageConstants

/**
 * @brief What the transport sends for a blocked request
 */
struct BlockResponse {
    uint32_t statusCode = BlockPageConstants::STATUS_CODE;
    std::string contentType = BlockPageConstants::CONTENT_TYPE;
    std::string body;
};

class BlockPage {
public:
    /// @brief Starts with the built-in page
    BlockPage();

    /**
     * @brief Load the operator's template.
     *
     * A missing, unreadable or empty file keeps the built-in page and logs a
     * warning.
     *
     * @return true when the file was loaded
     */
    bool LoadFromFile(const std::filesystem::path& path);

    /// @brief Replace the template directly
    void SetTemplate(std::string html);

    [[nodiscard]] const std::string& GetTemplate() const noexcept { return m_template; }

    [[nodiscard]] bool IsBuiltIn() const noexcept { return m_builtIn; }

    [[nodiscard]] std::string Render(std::string_view domain, std::string_view category) const;

    [[nodiscard]] BlockResponse MakeResponse(std::string_view domain, std::string_view category) const;

private:
    std::string m_template;
    bool m_builtIn = true;
};

}  // namespace Gateway
}  // namespace DomainSentry
