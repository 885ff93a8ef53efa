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
#include "pch.h"
#include "BlockPage.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/StringUtils.hpp"

namespace DomainSentry {
namespace Gateway {

namespace {

    constexpr size_t MAX_TEMPLATE_BYTES = 1024 * 1024;

    void ReplaceAll(std::string& text, std::string_view token, const std::string& value) {
        size_t pos = 0;
        while ((pos = text.find(token, pos)) != std::string::npos) {
            text.replace(pos, token.size(), value);
            pos += value.size();
        }
    }

}  // namespace

BlockPage::BlockPage()
    : m_template(BlockPageConstants::FALLBACK_HTML) {
}

bool BlockPage::LoadFromFile(const std::filesystem::path& path) {
    std::string html;
    Utils::FileUtils::Error err;
    if (!Utils::FileUtils::ReadAllText(path, html, &err, MAX_TEMPLATE_BYTES)) {
        DS_LOG_WARN("BlockPage", "Block page HTML %s could not be loaded (%s); default block page will be used",
                    path.c_str(), err.message.c_str());
        return false;
    }
    if (Utils::StringUtils::TrimView(html).empty()) {
        DS_LOG_WARN("BlockPage", "Block page HTML %s is empty; default block page will be used", path.c_str());
        return false;
    }

    m_template = std::move(html);
    m_builtIn = false;
    DS_LOG_DEBUG("BlockPage", "Loaded block page from %s (%zu bytes)", path.c_str(), m_template.size());
    return true;
}

void BlockPage::SetTemplate(std::string html) {
    m_template = std::move(html);
    m_builtIn = false;
}

std::string BlockPage::Render(std::string_view domain, std::string_view category) const {
    std::string out = m_template;
    ReplaceAll(out, "{{domain}}", Utils::StringUtils::HtmlEscape(domain));
    ReplaceAll(out, "{{category}}", Utils::StringUtils::HtmlEscape(category));
    return out;
}

BlockResponse BlockPage::MakeResponse(std::string_view domain, std::string_view category) const {
    BlockResponse response;
    response.body = Render(domain, category);
    return response;
}

}  // namespace Gateway
}  // namespace DomainSentry
