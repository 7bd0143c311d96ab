#include "live_reload.hpp"
#include <regex>

std::string live_reload_script(const std::string &reload_path) {
  static const std::string script = R"(
<script>(function(){var source=new EventSource('{{ reload_path }}');var version=null;source.onmessage=function(event){var next=Number(event.data||'0');if(version===null){version=next;return;}if(next>version){window.location.reload();}version=next;};})();</script>)";

  // '$' is special in a regex replacement.
  std::string replacement;
  for (char c : reload_path) {
    if (c == '$')
      replacement += '$';
    replacement += c;
  }

  return std::regex_replace(script, std::regex(R"(\{\{\s*reload_path\s*\}\})"),
                            replacement);
}

std::string inject_live_reload(const std::string &html,
                               const std::string &reload_path) {
  return html + live_reload_script(reload_path);
}

std::string sse_data_frame(uint64_t version) {
  return "data: " + std::to_string(version) + "\n\n";
}

std::string sse_keepalive_frame() { return ": keepalive\n\n"; }
