#include <sandkernel/core/preprocessor.hpp>
#include <sandkernel/core/logger.hpp>
#include <sandkernel/core/utils.hpp>

#include <algorithm>
#include <cctype>

namespace sandkernel {

// ============================================================================
// Line scanner
//
// Tracks string literals (including triple-quoted ones spanning lines),
// bracket depth and backslash continuations, and reports where statements
// start and which regions of a line are live code.
// ============================================================================

namespace {

struct ScanState {
    char triple;        // quote char of an open triple-quoted string, 0 if none
    int depth;          // open brackets
    bool continued;     // previous line ended with a backslash

    ScanState() : triple(0), depth(0), continued(false) {}
};

struct LineScan {
    std::vector<size_t> statements;                     // statement start offsets
    std::vector<std::pair<size_t, size_t>> spans;       // [begin, end) outside strings and comments
    size_t code_end;                                    // offset of a trailing comment, else size
};

size_t skip_blanks(const std::string& s, size_t i) {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
    return i;
}

LineScan scan_line(const std::string& line, ScanState& st) {
    LineScan out;
    const size_t n = line.size();
    out.code_end = n;

    bool logical_start = st.triple == 0 && st.depth == 0 && !st.continued;
    st.continued = false;

    size_t span_start = std::string::npos;
    if (st.triple == 0) {
        span_start = 0;
        if (logical_start) {
            size_t first = skip_blanks(line, 0);
            if (first < n && line[first] != '#') {
                out.statements.push_back(first);
            }
        }
    }

    size_t i = 0;
    while (i < n) {
        if (st.triple != 0) {
            const char q = st.triple;
            size_t j = i;
            bool closed = false;
            while (j < n) {
                if (line[j] == '\\') {
                    j += 2;
                    continue;
                }
                if (line[j] == q && j + 3 <= n && line[j + 1] == q && line[j + 2] == q) {
                    closed = true;
                    break;
                }
                ++j;
            }
            if (!closed) {
                i = n;
                break;
            }
            st.triple = 0;
            i = j + 3;
            span_start = i;
            continue;
        }

        const char c = line[i];
        if (c == '#') {
            if (span_start != std::string::npos && i > span_start) {
                out.spans.push_back(std::make_pair(span_start, i));
            }
            span_start = std::string::npos;
            out.code_end = i;
            break;
        }
        if (c == '"' || c == '\'') {
            if (span_start != std::string::npos && i > span_start) {
                out.spans.push_back(std::make_pair(span_start, i));
            }
            span_start = std::string::npos;
            if (i + 3 <= n && line[i + 1] == c && line[i + 2] == c) {
                st.triple = c;
                i += 3;
                continue;
            }
            size_t j = i + 1;
            while (j < n && line[j] != c) {
                if (line[j] == '\\') ++j;
                ++j;
            }
            i = j < n ? j + 1 : n;
            span_start = i;
            continue;
        }

        if (c == '(' || c == '[' || c == '{') {
            ++st.depth;
        } else if (c == ')' || c == ']' || c == '}') {
            if (st.depth > 0) --st.depth;
        } else if (c == ';' && st.depth == 0) {
            size_t next = skip_blanks(line, i + 1);
            if (next < n && line[next] != '#') {
                out.statements.push_back(next);
            }
        } else if (c == '\\' && i + 1 == n) {
            st.continued = true;
        }
        ++i;
    }

    if (span_start != std::string::npos && st.triple == 0 && span_start < n && out.code_end == n) {
        out.spans.push_back(std::make_pair(span_start, n));
    }
    return out;
}

// End offset (exclusive) of statement k on a scanned line
size_t statement_end(const std::string& line, const LineScan& sc, size_t k) {
    if (k + 1 < sc.statements.size()) {
        size_t semi = line.rfind(';', sc.statements[k + 1]);
        return semi == std::string::npos ? sc.statements[k + 1] : semi;
    }
    return sc.code_end;
}

// Part of a continuation line that still belongs to the open statement
size_t continuation_end(const std::string& line, const LineScan& sc) {
    if (sc.statements.empty()) return sc.code_end;
    size_t semi = line.rfind(';', sc.statements[0]);
    return semi == std::string::npos ? sc.statements[0] : semi;
}

// ============================================================================
// Import statement parsing
// ============================================================================

bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    if (!(std::isalpha(static_cast<unsigned char>(s[0])) || s[0] == '_')) return false;
    for (char c : s) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
    }
    return true;
}

bool is_dotted_name(const std::string& s) {
    if (s.empty()) return false;
    for (const auto& part : split(s, '.')) {
        if (!is_identifier(part)) return false;
    }
    return true;
}

bool keyword_at(const std::string& text, const char* kw) {
    std::string k(kw);
    if (!starts_with(text, k)) return false;
    if (text.size() == k.size()) return true;
    char next = text[k.size()];
    return next == ' ' || next == '\t' || next == '(' || next == '\\' || (k == "from" && next == '.');
}

std::vector<std::string> tokens(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\\') {
            if (!cur.empty()) {
                out.push_back(cur);
                cur.clear();
            }
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

struct ImportTarget {
    std::string module;
    std::string member;     // from-imports only
    std::string alias;
};

struct ImportStatement {
    bool from_form;
    bool relative;
    bool star;
    std::string module;     // from-imports only
    std::vector<ImportTarget> targets;

    ImportStatement() : from_form(false), relative(false), star(false) {}
};

// "name" or "name as alias"
bool parse_clause(const std::string& clause, bool dotted, std::string& name, std::string& alias) {
    std::vector<std::string> t = tokens(clause);
    if (t.size() == 1) {
        name = t[0];
        alias.clear();
    } else if (t.size() == 3 && t[1] == "as" && is_identifier(t[2])) {
        name = t[0];
        alias = t[2];
    } else {
        return false;
    }
    return dotted ? is_dotted_name(name) : is_identifier(name);
}

bool parse_import(const std::string& text, ImportStatement& out) {
    if (keyword_at(text, "import")) {
        std::string rest = text.substr(6);
        for (const auto& clause : split(rest, ',')) {
            ImportTarget target;
            if (!parse_clause(clause, true, target.module, target.alias)) return false;
            out.targets.push_back(target);
        }
        return !out.targets.empty();
    }

    if (!keyword_at(text, "from")) return false;
    out.from_form = true;

    std::string rest = ltrim(text.substr(4));
    size_t module_end = 0;
    while (module_end < rest.size() && rest[module_end] != ' ' && rest[module_end] != '\t' && rest[module_end] != '\\') {
        ++module_end;
    }
    std::string module = rest.substr(0, module_end);
    // "from .x import y" and "from . import y"
    if (!module.empty() && module[0] == '.') {
        out.relative = true;
        size_t dots = module.find_first_not_of('.');
        module = dots == std::string::npos ? "" : module.substr(dots);
    }
    if (!out.relative && !is_dotted_name(module)) return false;
    out.module = module;

    rest = ltrim(rest.substr(module_end));
    while (!rest.empty() && rest[0] == '\\') rest = ltrim(rest.substr(1));
    if (!keyword_at(rest, "import")) return false;
    std::string names = trim(rest.substr(6));

    if (!names.empty() && names[0] == '(') {
        if (names.back() != ')') return false;
        names = names.substr(1, names.size() - 2);
    }
    if (trim(names) == "*") {
        out.star = true;
        return true;
    }

    for (const auto& clause : split(names, ',')) {
        if (trim(clause).empty()) continue;
        ImportTarget target;
        target.module = out.module;
        if (!parse_clause(clause, false, target.member, target.alias)) return false;
        out.targets.push_back(target);
    }
    return !out.targets.empty();
}

std::string collapse_whitespace(const std::string& s) {
    return join(tokens(s), " ");
}

std::string quoted(const std::string& s) {
    return "\"" + s + "\"";
}

std::string top_level(const std::string& name) {
    size_t dot = name.find('.');
    return dot == std::string::npos ? name : name.substr(0, dot);
}

struct Edit {
    size_t begin;
    size_t end;
    std::string text;
};

std::string apply_edits(const std::string& line, std::vector<Edit> edits) {
    std::sort(edits.begin(), edits.end(), [](const Edit& a, const Edit& b) { return a.begin > b.begin; });
    std::string out = line;
    for (const auto& e : edits) {
        out.replace(e.begin, e.end - e.begin, e.text);
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// Preprocessor Implementation
// ============================================================================

const char* audit_action_name(AuditAction action) {
    switch (action) {
        case AuditAction::Rewritten: return "rewritten";
        case AuditAction::Shadowed: return "shadowed";
        case AuditAction::Blocked: return "blocked";
        case AuditAction::Intercepted: return "intercepted";
    }
    return "unknown";
}

std::vector<std::string> PreprocessResult::notices() const {
    std::vector<std::string> out;
    for (const auto& entry : audit) {
        if (entry.action != AuditAction::Blocked) continue;
        out.push_back("line " + std::to_string(entry.line) + ": BLOCKED: " + entry.statement +
                      " (not in allowed list)");
    }
    return out;
}

bool PreprocessResult::has_blocked() const {
    for (const auto& entry : audit) {
        if (entry.action == AuditAction::Blocked) return true;
    }
    return false;
}

Preprocessor::Preprocessor(const CapabilityLoader& capabilities)
    : capabilities_(capabilities)
{}

namespace {

class Rewriter {
public:
    Rewriter(const CapabilityLoader& caps, std::vector<AuditEntry>& audit)
        : caps_(caps), audit_(audit)
    {
        chart_aliases_.insert("plt");
        chart_aliases_.insert("pyplot");
    }

    // First pass: names the script binds to matplotlib.pyplot
    void collect_aliases(const ImportStatement& stmt) {
        if (stmt.relative || stmt.star) return;
        for (const auto& t : stmt.targets) {
            if (!stmt.from_form && t.module == "matplotlib.pyplot") {
                chart_aliases_.insert(t.alias.empty() ? t.module : t.alias);
            } else if (stmt.from_form && t.module == "matplotlib" && t.member == "pyplot") {
                chart_aliases_.insert(t.alias.empty() ? t.member : t.alias);
            }
        }
    }

    // Replacement code for one import statement; "blocked" collects the
    // parts that were refused
    std::string rewrite(const ImportStatement& stmt, const std::string& text, int line_no, bool& blocked) {
        std::vector<std::string> parts;
        blocked = false;

        if (stmt.from_form) {
            const CapabilitySpec* owner = stmt.relative ? nullptr : caps_.owner_of(stmt.module);
            if (!owner) {
                blocked = true;
                audit_.push_back(AuditEntry(line_no, AuditAction::Blocked, text, stmt.module));
                return "pass";
            }
            if (stmt.star) {
                audit_.push_back(AuditEntry(line_no, AuditAction::Rewritten, text, stmt.module));
                return std::string(Preprocessor::hook_object()) + ".import_all(" + quoted(stmt.module) + ")";
            }
            for (const auto& t : stmt.targets) {
                std::string target = t.alias.empty() ? t.member : t.alias;
                if (target == top_level(stmt.module)) {
                    // "from datetime import datetime" must not clobber the container for later calls
                    parts.push_back(target + " = " + Preprocessor::hook_object() + ".shadow_member(" +
                                    quoted(stmt.module) + ", " + quoted(t.member) + ", " + quoted(target) + ")");
                    audit_.push_back(AuditEntry(line_no, AuditAction::Shadowed, text, stmt.module + "." + t.member));
                } else {
                    parts.push_back(target + " = " + Preprocessor::hook_object() + ".member(" +
                                    quoted(stmt.module) + ", " + quoted(t.member) + ")");
                    audit_.push_back(AuditEntry(line_no, AuditAction::Rewritten, text, stmt.module + "." + t.member));
                }
            }
            return join(parts, "; ");
        }

        for (const auto& t : stmt.targets) {
            if (!caps_.owner_of(t.module)) {
                blocked = true;
                audit_.push_back(AuditEntry(line_no, AuditAction::Blocked, "import " + t.module, t.module));
                continue;
            }
            if (!t.alias.empty()) {
                parts.push_back(t.alias + " = " + Preprocessor::hook_object() + ".load(" + quoted(t.module) + ")");
            } else if (t.module.find('.') != std::string::npos) {
                parts.push_back(top_level(t.module) + " = " + Preprocessor::hook_object() + ".load_root(" +
                                quoted(t.module) + ")");
            } else {
                parts.push_back(t.module + " = " + Preprocessor::hook_object() + ".load(" + quoted(t.module) + ")");
            }
            audit_.push_back(AuditEntry(line_no, AuditAction::Rewritten, text, t.module));
        }
        return parts.empty() ? "pass" : join(parts, "; ");
    }

    // Chart show()/savefig() calls inside live code regions
    void intercept(const std::string& line, const LineScan& sc, size_t from, size_t to,
                   int line_no, std::vector<Edit>& edits) {
        for (const auto& span : sc.spans) {
            size_t begin = std::max(span.first, from);
            size_t end = std::min(span.second, to);
            if (begin >= end) continue;
            for (const auto& alias : chart_aliases_) {
                intercept_method(line, begin, end, alias, "show", "render_charts", line_no, edits);
                intercept_method(line, begin, end, alias, "savefig", "save_figure", line_no, edits);
            }
        }
    }

private:
    void intercept_method(const std::string& line, size_t begin, size_t end, const std::string& alias,
                          const char* method, const char* hook, int line_no, std::vector<Edit>& edits) {
        const std::string needle = alias + "." + method;
        size_t pos = begin;
        while ((pos = line.find(needle, pos)) != std::string::npos && pos + needle.size() <= end) {
            size_t after = skip_blanks(line, pos + needle.size());
            bool boundary_before = pos == 0 ||
                !(std::isalnum(static_cast<unsigned char>(line[pos - 1])) || line[pos - 1] == '_' || line[pos - 1] == '.');
            if (boundary_before && after < end && line[after] == '(') {
                edits.push_back(Edit{pos, pos + needle.size(), std::string(Preprocessor::hook_object()) + "." + hook});
                audit_.push_back(AuditEntry(line_no, AuditAction::Intercepted, trim(line), alias + "." + method));
            }
            pos += needle.size();
        }
    }

    const CapabilityLoader& caps_;
    std::vector<AuditEntry>& audit_;
    std::set<std::string> chart_aliases_;
};

} // anonymous namespace

PreprocessResult Preprocessor::preprocess(const std::string& script) const {
    PreprocessResult result;

    std::string source = script;
    source.erase(std::remove(source.begin(), source.end(), '\r'), source.end());
    std::vector<std::string> lines = split(source, '\n');

    Rewriter rewriter(capabilities_, result.audit);

    // Pass 1: chart aliases, so calls above their import line are caught too
    {
        ScanState st;
        std::string pending;
        for (const auto& line : lines) {
            const bool in_import = !pending.empty();
            LineScan sc = scan_line(line, st);
            if (in_import) {
                pending += " " + line.substr(0, continuation_end(line, sc));
                if (st.depth > 0 || st.continued) continue;
                ImportStatement stmt;
                if (parse_import(trim(collapse_whitespace(pending)), stmt)) {
                    rewriter.collect_aliases(stmt);
                }
                pending.clear();
            }
            // statements[] on a closing line only holds what follows the bracket
            for (size_t k = 0; k < sc.statements.size(); ++k) {
                std::string text = line.substr(sc.statements[k], statement_end(line, sc, k) - sc.statements[k]);
                if (k + 1 == sc.statements.size() && (st.depth > 0 || st.continued)) {
                    pending = text;
                    break;
                }
                ImportStatement stmt;
                if (parse_import(trim(collapse_whitespace(text)), stmt)) {
                    rewriter.collect_aliases(stmt);
                }
            }
        }
    }

    // Pass 2: rewrite
    ScanState st;
    std::vector<std::string> out;
    out.reserve(lines.size());

    for (size_t idx = 0; idx < lines.size(); ++idx) {
        const std::string line = lines[idx];
        const int line_no = static_cast<int>(idx) + 1;
        LineScan sc = scan_line(line, st);

        std::vector<Edit> edits;
        std::string marker;
        size_t live_from = 0;

        // Set when an import continues onto following lines
        size_t multi_start = std::string::npos;
        std::string multi_code;
        std::vector<size_t> continuation;
        size_t tail_line = 0;
        size_t tail_start = std::string::npos;

        for (size_t k = 0; k < sc.statements.size(); ++k) {
            size_t s = sc.statements[k];
            size_t e = statement_end(line, sc, k);
            std::string text = rtrim(line.substr(s, e - s));
            if (!keyword_at(text, "import") && !keyword_at(text, "from")) {
                continue;
            }

            // Gather the rest of a bracketed or backslash-continued import
            std::vector<size_t> rest;
            std::string full = text;
            size_t rest_tail_line = 0;
            size_t rest_tail_start = std::string::npos;
            if (k + 1 == sc.statements.size() && (st.depth > 0 || st.continued)) {
                ScanState lookahead = st;
                size_t j = idx + 1;
                while (j < lines.size() && (lookahead.depth > 0 || lookahead.continued)) {
                    LineScan csc = scan_line(lines[j], lookahead);
                    full += " " + lines[j].substr(0, continuation_end(lines[j], csc));
                    rest.push_back(j);
                    if (!csc.statements.empty()) {
                        rest_tail_line = j;
                        rest_tail_start = csc.statements[0];
                    }
                    ++j;
                }
            }

            std::string normalized = trim(collapse_whitespace(full));
            ImportStatement stmt;
            if (!parse_import(normalized, stmt)) {
                LOG_DEBUG("[Preprocessor] line %d: unrecognized import form left as is", line_no);
                continue;
            }

            bool blocked = false;
            std::string code = rewriter.rewrite(stmt, normalized, line_no, blocked);
            std::string note = blocked ? "BLOCKED: " + normalized + " (not in allowed list)" : normalized;
            marker += marker.empty() ? note : "; " + note;

            if (rest.empty()) {
                edits.push_back(Edit{s, e, code});
                live_from = std::max(live_from, e);
            } else {
                multi_start = s;
                multi_code = code;
                continuation = rest;
                tail_line = rest_tail_line;
                tail_start = rest_tail_start;
            }
        }

        if (multi_start == std::string::npos) {
            rewriter.intercept(line, sc, 0, line.size(), line_no, edits);
            std::string rewritten = apply_edits(line, edits);
            if (!marker.empty()) {
                // keep an original trailing comment after the marker
                std::string comment = sc.code_end < line.size() ? line.substr(sc.code_end) : "";
                std::string code = rewritten.substr(0, rewritten.size() - comment.size());
                rewritten = rtrim(code) + "  # [sandbox] " + marker + (comment.empty() ? "" : "  " + comment);
            }
            out.push_back(rewritten);
            continue;
        }

        // Multi-line import: the first line carries the rewrite, the
        // continuation lines become comments, and a statement after the
        // closing bracket keeps running at the import's indentation
        rewriter.intercept(line, sc, 0, multi_start, line_no, edits);
        out.push_back(apply_edits(line.substr(0, multi_start), edits) + multi_code + "  # [sandbox] " + marker);

        const std::string indent = line.substr(0, skip_blanks(line, 0));
        for (size_t j : continuation) {
            idx = j;
            scan_line(lines[j], st);
            const std::string& cont = lines[j];
            if (j == tail_line && tail_start != std::string::npos) {
                std::string tail = indent + cont.substr(tail_start);
                ScanState fresh;
                LineScan tsc = scan_line(tail, fresh);
                std::vector<Edit> tail_edits;
                rewriter.intercept(tail, tsc, 0, tail.size(), static_cast<int>(j) + 1, tail_edits);
                out.push_back(apply_edits(tail, tail_edits));
            } else if (trim(cont).empty()) {
                out.push_back(cont);
            } else {
                out.push_back(cont.substr(0, skip_blanks(cont, 0)) + "# [sandbox] " + trim(cont));
            }
        }
    }

    result.code = join(out, "\n");
    return result;
}

} // namespace sandkernel
