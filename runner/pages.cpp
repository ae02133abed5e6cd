#include "pages.h"
#include "modpack/download.h"

#include <sstream>

namespace modpack {

namespace {

std::string base_page(const std::string& inner) {
    std::ostringstream o;
    o << "<!doctype html>\n"
         "<html lang=\"en\">\n"
         "<head>\n"
         "  <meta charset=\"utf-8\" />\n"
         "  <title>modpack: node_modules builder</title>\n"
         "  <style>\n"
         "    *{box-sizing:border-box}\n"
         "    body{margin:0;font-family:system-ui,sans-serif;display:flex;align-items:center;justify-content:center;"
         "flex-direction:column;min-height:100vh;background:#f9fafb}\n"
         "    form,main{background:#fff;padding:2rem;border-radius:1rem;box-shadow:0 8px 24px rgba(0,0,0,.05);"
         "display:flex;flex-direction:column;gap:1rem;width:clamp(320px,90vw,560px)}\n"
         "    h2{margin:0;font-size:1.25rem;text-align:center}\n"
         "    label{font-weight:600}\n"
         "    textarea{min-height:160px;font-family:monospace;padding:.5rem;border:1px solid #e5e7eb;border-radius:.5rem}\n"
         "    input[type=file],input.copy{padding:.5rem;border:1px solid #e5e7eb;border-radius:.5rem;font-family:monospace}\n"
         "    button{padding:.75rem 1.5rem;border:none;border-radius:.5rem;font-size:1rem;cursor:pointer;"
         "background:#2563eb;color:#fff}\n"
         "    button:disabled{opacity:.6;cursor:not-allowed}\n"
         "    code{background:#f3f4f6;padding:.25rem .5rem;border-radius:.25rem;font-size:.875rem}\n"
         "  </style>\n"
         "</head>\n"
         "<body>\n"
      << inner
      << "\n</body>\n</html>\n";
    return o.str();
}

} // namespace

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default:   out.push_back(c); break;
        }
    }
    return out;
}

std::string human_duration(int64_t ms) {
    int64_t total_s = ms / 1000;
    int64_t h = total_s / 3600;
    int64_t m = (total_s % 3600) / 60;
    int64_t s = total_s % 60;
    auto unit = [](int64_t n, const char* name) {
        return std::to_string(n) + " " + name + (n == 1 ? "" : "s");
    };
    std::string out;
    if (h > 0) out = unit(h, "hour");
    if (m > 0) out += (out.empty() ? "" : " ") + unit(m, "minute");
    if (out.empty()) out = unit(s, "second");
    return out;
}

std::string render_form_page() {
    return base_page(
        "<form method=\"POST\" enctype=\"multipart/form-data\" action=\"/upload\">\n"
        "  <h2>Build &amp; share node_modules</h2>\n"
        "  <label>Upload package.json</label>\n"
        "  <input type=\"file\" name=\"packageFile\" accept=\".json\" />\n"
        "  <label>Or paste package.json contents</label>\n"
        "  <textarea name=\"packageText\" placeholder=\"{&#10;  &quot;name&quot;: &quot;my-app&quot;,&#10;  ...&#10;}\"></textarea>\n"
        "  <button id=\"buildBtn\" type=\"submit\">Install &amp; Generate Link</button>\n"
        "  <script>\n"
        "    const btn=document.getElementById('buildBtn');\n"
        "    document.querySelector('form').addEventListener('submit',()=>{btn.disabled=true;btn.textContent='Building...';});\n"
        "  </script>\n"
        "</form>");
}

std::string render_success_page(const std::string& link, int64_t ttl_ms) {
    const std::string l = html_escape(link);
    std::ostringstream o;
    o << "<main>\n"
      << "  <h2>Your archive is ready!</h2>\n"
      << "  <p>Download with:</p>\n"
      << "  <p><code>curl -OJ " << l << "</code></p>\n"
      << "  <input class=\"copy\" value=\"" << l << "\" readonly onclick=\"this.select()\" />\n"
      << "  <p style=\"font-size:.875rem;color:#6b7280\">Saves as <code>" << kAttachmentName
      << "</code>; link expires in " << html_escape(human_duration(ttl_ms)) << ".</p>\n"
      << "  <a href=\"/\">&larr; Build another</a>\n"
      << "</main>";
    return base_page(o.str());
}

std::string render_failure_text(const std::string& message, const std::string& diagnostics) {
    if (diagnostics.empty()) return message;
    return message + ":\n" + diagnostics;
}

} // namespace modpack
