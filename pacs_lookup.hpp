/**
 * pacs adapter - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include <pugixml.hpp>
#include <array>
#include <string>
#include <string_view>
#include <vector>
#include <cstring>
#include <algorithm>

namespace pacs {

// ---------- Helpers (namespace-agnostic) ----------
inline const char* ln(const pugi::xml_node& n) {
    if (!n) return "";
    const char* full = n.name();
    const char* c = std::strrchr(full, ':');
    return c ? c + 1 : full;
}
inline bool isln(const pugi::xml_node& n, std::string_view wanted) { return wanted == ln(n); }

inline const char* ln(const pugi::xml_attribute& a) {
    if (!a) return "";
    const char* full = a.name(); const char* c = std::strrchr(full, ':');
    return c ? c + 1 : full;
}
inline bool isln(const pugi::xml_attribute& a, std::string_view wanted) { return wanted == ln(a); }

inline std::string txt(const pugi::xml_node& n) {
    std::string s = n.text().as_string(); // UTF-8
    auto notsp = [](int ch){ return ch!=' ' && ch!='\t' && ch!='\n' && ch!='\r'; };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
    s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
    return s;
}

inline std::string attr_any(const pugi::xml_node& n, std::string_view name) {
    for (pugi::xml_attribute at = n.first_attribute(); at; at = at.next_attribute())
        if (isln(at, name)) return at.value();
    return std::string();
}

// "PmtId/InstrId" -> {"PmtId","InstrId"}
inline std::vector<std::string_view> split_path(std::string_view path) {
    std::vector<std::string_view> segs;
    size_t b = 0;
    while (b <= path.size()) {
        size_t e = path.find('/', b);
        if (e == std::string_view::npos) e = path.size();
        if (e > b) segs.push_back(path.substr(b, e - b));
        b = e + 1;
    }
    return segs;
}

// ---------- Namespace ----------
struct NamespaceContext {
    std::string uri;      // namespace of the document element, empty if none
    std::string prefix;   // its prefix, empty for a default namespace
};

inline NamespaceContext detect_namespace(const pugi::xml_node& root) {
    NamespaceContext ns;
    if (!root) return ns;
    const char* full = root.name();
    const char* colon = std::strchr(full, ':');
    std::string wanted = "xmlns";
    if (colon) {
        ns.prefix.assign(full, static_cast<size_t>(colon - full));
        wanted += ":" + ns.prefix;
    }
    for (pugi::xml_attribute at = root.first_attribute(); at; at = at.next_attribute()) {
        if (wanted == at.name()) { ns.uri = at.value(); break; }
    }
    return ns;
}

// ---------- Lookup strategies ----------
// Evaluated in this order for every candidate path.
enum class LookupStrategy {
    Unqualified,          // exact child names, no prefix
    NamespaceQualified,   // exact child names carrying the root's prefix
    LocalNameScan         // depth-first scan inside the scope, local-name path suffix
};

inline constexpr std::array<LookupStrategy, 3> kLookupOrder{
    LookupStrategy::Unqualified,
    LookupStrategy::NamespaceQualified,
    LookupStrategy::LocalNameScan
};

inline const char* to_string(LookupStrategy s) {
    switch (s) {
    case LookupStrategy::Unqualified:        return "unqualified";
    case LookupStrategy::NamespaceQualified: return "namespace-qualified";
    case LookupStrategy::LocalNameScan:      return "local-name-scan";
    }
    return "?";
}

inline pugi::xml_node child_named(const pugi::xml_node& p, std::string_view name) {
    for (pugi::xml_node c = p.first_child(); c; c = c.next_sibling())
        if (c.type() == pugi::node_element && name == c.name()) return c;
    return pugi::xml_node();
}

// true if n and its ancestors (up to, excluding, scope) end with segs by local name
inline bool matches_suffix(pugi::xml_node n, const pugi::xml_node& scope,
                           const std::vector<std::string_view>& segs) {
    for (size_t k = segs.size(); k-- > 0;) {
        if (!n || n == scope || !isln(n, segs[k])) return false;
        n = n.parent();
    }
    return true;
}

// Iterative pre-order walk; nesting depth of untrusted input never reaches the stack.
inline pugi::xml_node scan_local(const pugi::xml_node& scope, const std::vector<std::string_view>& segs) {
    if (!scope || segs.empty()) return pugi::xml_node();
    pugi::xml_node cur = scope.first_child();
    while (cur) {
        if (cur.type() == pugi::node_element && matches_suffix(cur, scope, segs)) return cur;
        if (cur.first_child()) {
            cur = cur.first_child();
            continue;
        }
        while (cur && cur != scope && !cur.next_sibling()) cur = cur.parent();
        if (!cur || cur == scope) break;
        cur = cur.next_sibling();
    }
    return pugi::xml_node();
}

inline pugi::xml_node find_with(const pugi::xml_node& scope, std::string_view path,
                                const NamespaceContext& ns, LookupStrategy strategy) {
    const std::vector<std::string_view> segs = split_path(path);
    if (!scope || segs.empty()) return pugi::xml_node();

    switch (strategy) {
    case LookupStrategy::Unqualified: {
        pugi::xml_node n = scope;
        for (std::string_view s : segs) {
            n = child_named(n, s);
            if (!n) break;
        }
        return n;
    }
    case LookupStrategy::NamespaceQualified: {
        if (ns.prefix.empty()) return pugi::xml_node();
        pugi::xml_node n = scope;
        for (std::string_view s : segs) {
            std::string q = ns.prefix + ":";
            q.append(s.data(), s.size());
            n = child_named(n, q);
            if (!n) break;
        }
        return n;
    }
    case LookupStrategy::LocalNameScan:
        return scan_local(scope, segs);
    }
    return pugi::xml_node();
}

// First hit over kLookupOrder; reports the strategy that matched if asked.
inline pugi::xml_node find_element(const pugi::xml_node& scope, std::string_view path,
                                   const NamespaceContext& ns, LookupStrategy* matched = nullptr) {
    for (LookupStrategy s : kLookupOrder) {
        pugi::xml_node n = find_with(scope, path, ns, s);
        if (n) {
            if (matched) *matched = s;
            return n;
        }
    }
    return pugi::xml_node();
}

// ---------- Field table ----------
enum class Field {
    // blocks
    GroupHeader,
    Transaction,
    Debtor,
    DebtorAccount,
    DebtorAgent,
    Creditor,
    CreditorAccount,
    CreditorAgent,
    Remittance,
    PostalAddress,
    // group header
    MessageId,
    CreationDateTime,
    // transaction
    InstructionId,
    EndToEndId,
    TransactionId,
    Uetr,
    Amount,
    SettlementDate,
    // party, scoped at Dbtr/Cdtr
    PartyName,
    PartyBic,
    // postal address, scoped at PstlAdr
    Street,
    Building,
    PostCode,
    Town,
    Country,
    // account, scoped at DbtrAcct/CdtrAcct
    AccountId,
    // agent, scoped at DbtrAgt/CdtrAgt
    AgentBic,
    AgentName,
    AgentCountry,
    Count
};

struct FieldSpec {
    Field field;
    const char* name;                  // reported in errors
    std::array<const char*, 4> paths;  // ordered candidates, nullptr-terminated
};

// The schema-tolerance policy for pacs.008: one row per field.
inline const std::array<FieldSpec, static_cast<size_t>(Field::Count)>& field_table() {
    static const std::array<FieldSpec, static_cast<size_t>(Field::Count)> t{{
        {Field::GroupHeader,      "GrpHdr",          {"FIToFICstmrCdtTrf/GrpHdr", "GrpHdr", nullptr, nullptr}},
        {Field::Transaction,      "CdtTrfTxInf",     {"FIToFICstmrCdtTrf/CdtTrfTxInf", "CdtTrfTxInf", nullptr, nullptr}},
        {Field::Debtor,           "Dbtr",            {"Dbtr", nullptr, nullptr, nullptr}},
        {Field::DebtorAccount,    "DbtrAcct",        {"DbtrAcct", nullptr, nullptr, nullptr}},
        {Field::DebtorAgent,      "DbtrAgt",         {"DbtrAgt", nullptr, nullptr, nullptr}},
        {Field::Creditor,         "Cdtr",            {"Cdtr", nullptr, nullptr, nullptr}},
        {Field::CreditorAccount,  "CdtrAcct",        {"CdtrAcct", nullptr, nullptr, nullptr}},
        {Field::CreditorAgent,    "CdtrAgt",         {"CdtrAgt", nullptr, nullptr, nullptr}},
        {Field::Remittance,       "RmtInf",          {"RmtInf", nullptr, nullptr, nullptr}},
        {Field::PostalAddress,    "PstlAdr",         {"PstlAdr", nullptr, nullptr, nullptr}},
        {Field::MessageId,        "MsgId",           {"MsgId", nullptr, nullptr, nullptr}},
        {Field::CreationDateTime, "CreDtTm",         {"CreDtTm", nullptr, nullptr, nullptr}},
        {Field::InstructionId,    "InstrId",         {"PmtId/InstrId", nullptr, nullptr, nullptr}},
        {Field::EndToEndId,       "EndToEndId",      {"PmtId/EndToEndId", nullptr, nullptr, nullptr}},
        {Field::TransactionId,    "TxId",            {"PmtId/TxId", nullptr, nullptr, nullptr}},
        {Field::Uetr,             "UETR",            {"PmtId/UETR", nullptr, nullptr, nullptr}},
        {Field::Amount,           "IntrBkSttlmAmt",  {"IntrBkSttlmAmt", "InstdAmt", nullptr, nullptr}},
        {Field::SettlementDate,   "IntrBkSttlmDt",   {"IntrBkSttlmDt", nullptr, nullptr, nullptr}},
        {Field::PartyName,        "Nm",              {"Nm", nullptr, nullptr, nullptr}},
        {Field::PartyBic,         "AnyBIC",          {"Id/OrgId/AnyBIC", "Id/OrgId/BICOrBEI", nullptr, nullptr}},
        {Field::Street,           "StrtNm",          {"StrtNm", nullptr, nullptr, nullptr}},
        {Field::Building,         "BldgNb",          {"BldgNb", nullptr, nullptr, nullptr}},
        {Field::PostCode,         "PstCd",           {"PstCd", nullptr, nullptr, nullptr}},
        {Field::Town,             "TwnNm",           {"TwnNm", nullptr, nullptr, nullptr}},
        {Field::Country,          "Ctry",            {"Ctry", nullptr, nullptr, nullptr}},
        {Field::AccountId,        "Id",              {"Id/IBAN", "Id/Othr/Id", nullptr, nullptr}},
        {Field::AgentBic,         "BICFI",           {"FinInstnId/BICFI", "FinInstnId/BIC", "FinInstnId/ClrSysMmbId/MmbId", nullptr}},
        {Field::AgentName,        "Nm",              {"FinInstnId/Nm", nullptr, nullptr, nullptr}},
        {Field::AgentCountry,     "Ctry",            {"FinInstnId/PstlAdr/Ctry", nullptr, nullptr, nullptr}},
    }};
    return t;
}

inline const FieldSpec& spec_of(Field f) { return field_table()[static_cast<size_t>(f)]; }

// Block lookup: first candidate path that resolves to an element.
inline pugi::xml_node find_field(const pugi::xml_node& scope, Field f, const NamespaceContext& ns) {
    for (const char* p : spec_of(f).paths) {
        if (!p) break;
        if (pugi::xml_node n = find_element(scope, p, ns)) return n;
    }
    return pugi::xml_node();
}

// Value lookup: first candidate whose element carries non-empty text.
inline std::string field_text(const pugi::xml_node& scope, Field f, const NamespaceContext& ns) {
    for (const char* p : spec_of(f).paths) {
        if (!p) break;
        if (pugi::xml_node n = find_element(scope, p, ns)) {
            std::string s = txt(n);
            if (!s.empty()) return s;
        }
    }
    return std::string();
}

} // namespace pacs
