#include "csv_pager/cursor_codec.hpp"
#include "csv_pager/json_writer.hpp"
#include "csv_pager/memory_source.hpp"
#include "csv_pager/page_engine.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream o; o << in.rdbuf();
  return o.str();
}

// Follow cursors to the end; returns false on the first error.
static bool page_all(cp::PageEngine& eng, cp::PageRequest req, std::vector<cp::PageResponse>& pages,
                     cp::Error& err) {
  for (int guard = 0; guard < 100; ++guard) {
    cp::PageResponse resp;
    if (!eng.get_page(req, resp, &err)) return false;
    pages.push_back(resp);
    if (!resp.has_next) return true;
    req.cursor = resp.next_cursor;
  }
  return false;
}

static std::string dump(const std::vector<cp::Record>& recs) {
  std::string s;
  for (const auto& r : recs) { s += cp::JsonWriter::to_json(r); s += "\n"; }
  return s;
}

int main(){
  const fs::path f = "tests/data/customers.csv";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; return 2; }
  const std::string csv = slurp(f);

  cp::MemoryByteSource src;
  src.put("exports/customers.csv", csv);
  src.put("exports/headers_only.csv", csv.substr(0, csv.find('\n')));
  src.put("exports/bom.csv", "\xEF\xBB\xBF" + csv);
  src.put("exports/empty.csv", "");
  src.put("exports/blank_header.csv", "\n1,2\n");

  cp::PageEngine eng(src);
  cp::PageRequest req;
  req.key = "exports/customers.csv";
  req.page_size = 2;
  req.types = {{"Score", cp::AttributeType::Double}, {"Subscription Date", cp::AttributeType::DateTime}};

  // --- 5 rows in pages of 2/2/1, headers fetched once
  std::vector<cp::PageResponse> pages;
  cp::Error err;
  if (!page_all(eng, req, pages, err)) { std::cerr << "[FAIL] paging: " << err.message << "\n"; return 1; }
  if (pages.size() != 3 || pages[0].records.size() != 2 || pages[1].records.size() != 2 || pages[2].records.size() != 1) {
    std::cerr << "[FAIL] expected pages 2/2/1, got " << pages.size() << " pages\n"; return 1;
  }
  if (pages[0].start_offset != 121 || pages[1].start_offset != 655 || pages[2].start_offset != 1095) {
    std::cerr << "[FAIL] start offsets " << pages[0].start_offset << "/" << pages[1].start_offset
              << "/" << pages[2].start_offset << "\n"; return 1;
  }
  if (!pages[2].next_cursor.empty()) { std::cerr << "[FAIL] final page has a cursor\n"; return 1; }
  if (src.range_requests() != 4) { std::cerr << "[FAIL] range requests " << src.range_requests() << ", want 4\n"; return 1; }
  if (pages[0].stats.headers_from_cursor || !pages[1].stats.headers_from_cursor) {
    std::cerr << "[FAIL] header caching stats\n"; return 1;
  }
  if (pages[0].headers.size() != 13 || pages[0].headers[12] != "KnownAliases") { std::cerr << "[FAIL] headers\n"; return 1; }

  {
    const cp::Record& first = pages[0].records[0];
    if (first.size() != 13) { std::cerr << "[FAIL] record width " << first.size() << "\n"; return 1; }
    if (std::get<double>(*first.find("Score")) != 1.1) { std::cerr << "[FAIL] Score\n"; return 1; }
    // DateTime columns pass through unless extended typing is enabled.
    if (std::get<std::string>(*first.find("Subscription Date")) != "2021-12-23") { std::cerr << "[FAIL] date\n"; return 1; }
    if (std::get<cp::ListOfObject>(*first.find("KnownAliases")).size() != 2) { std::cerr << "[FAIL] aliases\n"; return 1; }
    const cp::Record& third = pages[1].records[0];
    if (std::get<std::string>(*third.find("Company")) != "Rose, Deleon and Sanders") { std::cerr << "[FAIL] quoted comma\n"; return 1; }
    if (!std::holds_alternative<std::string>(*third.find("KnownAliases"))) { std::cerr << "[FAIL] truncated JSON expanded\n"; return 1; }
  }

  // --- resuming from cursors yields exactly the single-page result
  std::string paged;
  for (const auto& p : pages) paged += dump(p.records);
  {
    cp::PageRequest whole = req;
    whole.page_size = 1000;
    cp::PageResponse resp;
    if (!eng.get_page(whole, resp, &err) || resp.has_next) { std::cerr << "[FAIL] single page: " << err.message << "\n"; return 1; }
    if (dump(resp.records) != paged) { std::cerr << "[FAIL] paged records differ from one-shot records\n"; return 1; }
  }

  // --- a cursor without headers re-reads the header row
  {
    cp::PageRequest legacy = req;
    legacy.cursor = cp::encode_cursor(cp::Cursor{655, std::nullopt});
    cp::PageResponse resp;
    const auto before = src.range_requests();
    if (!eng.get_page(legacy, resp, &err)) { std::cerr << "[FAIL] legacy cursor: " << err.message << "\n"; return 1; }
    if (src.range_requests() - before != 2 || resp.start_offset != 655 || resp.records.size() != 2) {
      std::cerr << "[FAIL] legacy cursor resume\n"; return 1;
    }
    if (dump(resp.records) != dump(pages[1].records)) { std::cerr << "[FAIL] legacy cursor records\n"; return 1; }
  }

  // --- BOM shifts every offset by its length
  {
    cp::PageRequest b = req;
    b.key = "exports/bom.csv";
    cp::PageResponse resp;
    if (!eng.get_page(b, resp, &err)) { std::cerr << "[FAIL] bom: " << err.message << "\n"; return 1; }
    if (resp.start_offset != 124 || resp.headers[0] != "Score") { std::cerr << "[FAIL] BOM offset/header\n"; return 1; }
    std::optional<cp::Cursor> next;
    if (!cp::decode_cursor(resp.next_cursor, next) || !next || next->byte_offset != 658u) {
      std::cerr << "[FAIL] BOM next offset\n"; return 1;
    }
  }

  // --- headers only
  {
    cp::PageRequest h = req;
    h.key = "exports/headers_only.csv";
    cp::PageResponse resp;
    if (!eng.get_page(h, resp, &err)) { std::cerr << "[FAIL] headers only: " << err.message << "\n"; return 1; }
    if (!resp.records.empty() || resp.has_next || !resp.next_cursor.empty() || resp.headers.size() != 13) {
      std::cerr << "[FAIL] headers-only page\n"; return 1;
    }
  }

  // --- error kinds; a failed call leaves the response untouched
  struct Bad { std::string key; std::size_t page_size; std::string cursor; cp::ErrorKind kind; };
  const Bad bad[] = {
    {"",                          2,    "",          cp::ErrorKind::InvalidRequest},
    {"exports/customers.csv",     0,    "",          cp::ErrorKind::InvalidRequest},
    {"exports/customers.csv",     1001, "",          cp::ErrorKind::InvalidRequest},
    {"exports/customers.csv",     2,    "@@@@",      cp::ErrorKind::CursorDecode},
    {"exports/missing.csv",       2,    "",          cp::ErrorKind::SourceUnavailable},
    {"exports/empty.csv",         2,    "",          cp::ErrorKind::EmptyObject},
    {"exports/blank_header.csv",  2,    "",          cp::ErrorKind::MalformedHeader},
  };
  for (const auto& c : bad) {
    cp::PageRequest r = req;
    r.key = c.key;
    r.page_size = c.page_size;
    r.cursor = c.cursor;
    cp::PageResponse resp;
    resp.start_offset = 777;
    cp::Error e;
    if (eng.get_page(r, resp, &e)) { std::cerr << "[FAIL] '" << c.key << "' succeeded\n"; return 1; }
    if (e.kind != c.kind) {
      std::cerr << "[FAIL] '" << c.key << "': want " << cp::to_string(c.kind) << " got " << cp::to_string(e.kind)
                << " (" << e.message << ")\n";
      return 1;
    }
    if (resp.start_offset != 777) { std::cerr << "[FAIL] response modified on failure\n"; return 1; }
  }

  // --- injected source failures, then a retry with the same cursor
  {
    src.fail_with("exports/customers.csv", cp::SourceFailure::PermissionDenied);
    cp::PageRequest r = req;
    r.cursor = pages[0].next_cursor;
    cp::PageResponse resp;
    cp::Error e;
    if (eng.get_page(r, resp, &e) || e.kind != cp::ErrorKind::SourceUnavailable ||
        e.message.find("exports/customers.csv") == std::string::npos) {
      std::cerr << "[FAIL] permission denied: " << e.message << "\n"; return 1;
    }
    src.fail_with("exports/customers.csv", cp::SourceFailure::Timeout);
    if (eng.get_page(r, resp, &e) || e.kind != cp::ErrorKind::Timeout) { std::cerr << "[FAIL] timeout kind\n"; return 1; }
    src.clear_failure("exports/customers.csv");
    if (!eng.get_page(r, resp, &e) || dump(resp.records) != dump(pages[1].records)) {
      std::cerr << "[FAIL] retry after failure\n"; return 1;
    }
  }

  // --- coercion failure names the column and aborts the page
  {
    cp::PageRequest r = req;
    r.types = {{"First Name", cp::AttributeType::Int64}};
    cp::PageResponse resp;
    cp::Error e;
    if (eng.get_page(r, resp, &e) || e.kind != cp::ErrorKind::ValueCoercion ||
        e.message.find("\"First Name\"") == std::string::npos) {
      std::cerr << "[FAIL] coercion: " << e.message << "\n"; return 1;
    }
  }

  // --- extended typing parses the date and rejects a non-ISO one
  {
    cp::PageEngine::Config ecfg;
    ecfg.policy.extended_types = true;
    cp::PageEngine typed(src, ecfg);
    cp::PageResponse resp;
    cp::Error e;
    if (!typed.get_page(req, resp, &e) ||
        std::get<cp::DateTime>(*resp.records[0].find("Subscription Date")).epoch_ms != 1640217600000LL) {
      std::cerr << "[FAIL] extended date: " << e.message << "\n"; return 1;
    }
    cp::PageRequest r = req;
    r.types = {{"Company", cp::AttributeType::DateTime}};
    if (typed.get_page(r, resp, &e) || e.kind != cp::ErrorKind::ValueCoercion ||
        e.message.find("invalid datetime value") == std::string::npos) {
      std::cerr << "[FAIL] extended date rejection: " << e.message << "\n"; return 1;
    }
    if (!eng.get_page(r, resp, &e)) { std::cerr << "[FAIL] default engine rejected a DateTime cell\n"; return 1; }
  }

  std::cout << "[PASS] end-to-end paging over " << pages.size() << " pages\n";
  return 0;
}
