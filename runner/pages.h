#pragma once

#include <cstdint>
#include <string>

namespace modpack {

std::string html_escape(const std::string& s);

// "1 hour", "30 minutes", "45 seconds", "2 hours 15 minutes"
std::string human_duration(int64_t ms);

std::string render_form_page();
std::string render_success_page(const std::string& link, int64_t ttl_ms);

// Plain-text body for a failed build: message, then diagnostics if any.
std::string render_failure_text(const std::string& message, const std::string& diagnostics);

} // namespace modpack
