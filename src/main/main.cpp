#include "csv_pager/file_source.hpp"
#include "csv_pager/http_source.hpp"
#include "csv_pager/json_writer.hpp"
#include "csv_pager/page_engine.hpp"
#include "csv_pager/path_utils.hpp"
#include "csv_pager/value.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

struct Cli {
  std::string dir;
  std::string url;
  std::string key;
  std::string entity;
  std::string prefix;
  std::string cursor;
  std::string file_type = std::string(cp::kDefaultFileType);
  long long page_size = 100;
  long long max_row_bytes = 0;  // 0 -> engine default
  long long max_page_bytes = 0; // 0 -> engine default
  long long timeout_ms = 120 * 1000;
  std::vector<std::string> types; // COL:TYPE
  bool all = false;
  bool stats = false;
  bool extended_types = false; // parse Bool/DateTime/ListOfObject columns
};

void usage(std::ostream& o) {
  o << "Usage: csv-pager (--dir=DIR | --url=BASE) (--key=KEY | --entity=NAME [--prefix=P] [--file-type=csv])\n"
       "                 [--page-size=N] [--cursor=TOKEN] [--type=COL:TYPE]...\n"
       "                 [--max-row-bytes=N] [--max-page-bytes=N] [--timeout-ms=N]\n"
       "                 [--all] [--stats] [--extended-types]\n"
       "  TYPE: string|int64|double|bool|datetime|list_of_object\n";
}

bool parse_cli(int argc, char** argv, Cli& c, std::string& err) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    bool bad_number = false;
    auto eat_i = [&](const char* pfx, long long* out){
      if (a.rfind(pfx, 0) != 0) return false;
      const std::string v = a.substr(std::string(pfx).size());
      char* end = nullptr;
      const long long n = std::strtoll(v.c_str(), &end, 10);
      if (v.empty() || *end != '\0' || n < 0) bad_number = true;
      else *out = n;
      return true;
    };
    if (eat("--dir=", &c.dir)) continue;
    if (eat("--url=", &c.url)) continue;
    if (eat("--key=", &c.key)) continue;
    if (eat("--entity=", &c.entity)) continue;
    if (eat("--prefix=", &c.prefix)) continue;
    if (eat("--cursor=", &c.cursor)) continue;
    if (eat("--file-type=", &c.file_type)) continue;
    if (eat_i("--page-size=", &c.page_size) || eat_i("--max-row-bytes=", &c.max_row_bytes) ||
        eat_i("--max-page-bytes=", &c.max_page_bytes) || eat_i("--timeout-ms=", &c.timeout_ms)) {
      if (bad_number) { err = "not a non-negative integer: " + a; return false; }
      continue;
    }
    if (a.rfind("--type=", 0) == 0) { c.types.push_back(a.substr(7)); continue; }
    if (a == "--all")   { c.all = true; continue; }
    if (a == "--stats") { c.stats = true; continue; }
    if (a == "--extended-types") { c.extended_types = true; continue; }
    if (a == "-h" || a == "--help") {
      usage(std::cout);
      std::exit(0);
    }
    err = "unknown argument: " + a;
    return false;
  }
  if (c.dir.empty() == c.url.empty()) { err = "exactly one of --dir or --url is required"; return false; }
  if (c.key.empty() == c.entity.empty()) { err = "exactly one of --key or --entity is required"; return false; }
  if (!cp::is_supported_file_type(c.file_type)) { err = "unsupported file type: " + c.file_type; return false; }
  return true;
}

bool parse_types(const std::vector<std::string>& specs, cp::AttributeTypeMap& out, std::string& err) {
  for (const auto& s : specs) {
    const auto colon = s.rfind(':');
    if (colon == std::string::npos || colon == 0) { err = "bad --type (want COL:TYPE): " + s; return false; }
    auto t = cp::parse_attribute_type(std::string_view(s).substr(colon + 1));
    if (!t) { err = "unknown type in --type: " + s; return false; }
    out[s.substr(0, colon)] = *t;
  }
  return true;
}

// "http://host:port/bucket" -> base "http://host:port", path prefix "/bucket".
cp::HttpByteSource::Config http_config(const std::string& url) {
  cp::HttpByteSource::Config cfg;
  const auto scheme = url.find("://");
  const auto slash = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
  if (slash == std::string::npos) {
    cfg.base_url = url;
  } else {
    cfg.base_url = url.substr(0, slash);
    cfg.path_prefix = url.substr(slash);
    while (!cfg.path_prefix.empty() && cfg.path_prefix.back() == '/') cfg.path_prefix.pop_back();
  }
  return cfg;
}

void print_stats(const cp::PageStats& s) {
  std::cerr << "[page] stats=" << cp::JsonWriter::to_json(s) << "\n";
}

}

int main(int argc, char** argv) {
  Cli cli;
  std::string err;
  cp::AttributeTypeMap types;
  if (!parse_cli(argc, argv, cli, err) || !parse_types(cli.types, types, err)) {
    std::cerr << "csv-pager: " << err << "\n";
    usage(std::cerr);
    return 2;
  }

  std::unique_ptr<cp::ByteSource> source;
  if (!cli.dir.empty()) {
    source = std::make_unique<cp::FileByteSource>(cli.dir);
  } else {
    source = std::make_unique<cp::HttpByteSource>(http_config(cli.url));
  }

  cp::PageEngine::Config cfg;
  cfg.request_timeout = std::chrono::milliseconds(cli.timeout_ms);
  cfg.policy.extended_types = cli.extended_types;
  cp::PageEngine engine(*source, cfg);

  cp::PageRequest req;
  req.key = !cli.key.empty() ? cli.key : cp::object_key(cli.prefix, cli.entity, cli.file_type);
  req.page_size = static_cast<std::size_t>(cli.page_size);
  req.types = std::move(types);
  req.cursor = cli.cursor;
  if (cli.max_row_bytes > 0) req.max_row_bytes = static_cast<std::size_t>(cli.max_row_bytes);
  if (cli.max_page_bytes > 0) req.max_bytes_per_page = static_cast<std::uint64_t>(cli.max_page_bytes);

  std::cerr << "[source] " << (cli.dir.empty() ? "url=" + cli.url : "dir=" + cli.dir)
            << " key=" << req.key << "\n";

  std::uint64_t pages = 0;
  std::uint64_t rows = 0;
  for (;;) {
    cp::PageResponse resp;
    cp::Error e;
    if (!engine.get_page(req, resp, &e)) {
      if (e.kind == cp::ErrorKind::EmptyObject) {
        std::cerr << "[page] " << e.message << "; no records\n";
        return 0;
      }
      std::cerr << "[page] error kind=" << cp::to_string(e.kind) << ": " << e.message << "\n";
      if (!req.cursor.empty()) std::cerr << "[page] retry with --cursor=" << req.cursor << "\n";
      return 3;
    }

    for (const auto& r : resp.records) std::cout << cp::JsonWriter::to_json(r) << "\n";
    ++pages;
    rows += resp.records.size();
    if (cli.stats) print_stats(resp.stats);
    std::cerr << "[page] offset=" << resp.start_offset << " rows=" << resp.records.size()
              << " next_cursor=" << resp.next_cursor << "\n";

    if (!cli.all || !resp.has_next) break;
    req.cursor = resp.next_cursor;
  }
  std::cout.flush();
  if (cli.all) std::cerr << "[page] done pages=" << pages << " rows=" << rows << "\n";
  return 0;
}
