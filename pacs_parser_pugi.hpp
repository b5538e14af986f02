/**
 * pacs adapter - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "pacs_model.hpp"
#include "pacs_currency.hpp"
#include "pacs_sanitize.hpp"
#include "pacs_lookup.hpp"
#include <pugixml.hpp>
#include <chrono>
#include <fstream>
#include <istream>
#include <iterator>
#include <sstream>
#include <string>

namespace pacs {

struct ParserOptions {
    std::size_t max_message_bytes = 4u * 1024u * 1024u;
    std::size_t max_depth = 64;          // node nesting, document element = 1
    CurrencyAllowList currencies;
};

// Nesting depth of the tree below root, capped at limit + 1. Iterative.
inline std::size_t nesting_depth(const pugi::xml_node& root, std::size_t limit) {
    if (!root) return 0;
    std::size_t depth = 1, deepest = 1;
    pugi::xml_node cur = root;
    for (;;) {
        if (cur.first_child()) {
            cur = cur.first_child();
            if (++depth > deepest) deepest = depth;
            if (deepest > limit) return deepest;
            continue;
        }
        while (cur != root && !cur.next_sibling()) {
            cur = cur.parent();
            --depth;
        }
        if (cur == root) break;
        cur = cur.next_sibling();
    }
    return deepest;
}

inline std::string join_nonempty(const std::string& a, const std::string& b, const char* sep) {
    if (a.empty()) return b;
    if (b.empty()) return a;
    return a + sep + b;
}

// PstlAdr -> "StrtNm BldgNb, PstCd TwnNm" (or AdrLine lines), Ctry
inline void parse_postal_address(const pugi::xml_node& adr, const NamespaceContext& ns, PaymentParty& p) {
    const std::string street = join_nonempty(field_text(adr, Field::Street, ns),
                                             field_text(adr, Field::Building, ns), " ");
    const std::string town = join_nonempty(field_text(adr, Field::PostCode, ns),
                                           field_text(adr, Field::Town, ns), " ");
    p.address = join_nonempty(street, town, ", ");
    if (p.address.empty()) {
        for (pugi::xml_node l = adr.first_child(); l; l = l.next_sibling()) {
            if (!isln(l, "AdrLine")) continue;
            p.address = join_nonempty(p.address, txt(l), ", ");
        }
    }
    p.country = field_text(adr, Field::Country, ns);
}

inline PaymentParty parse_party(const pugi::xml_node& node, const NamespaceContext& ns) {
    PaymentParty p;
    p.name = field_text(node, Field::PartyName, ns);
    p.bic = field_text(node, Field::PartyBic, ns);
    if (pugi::xml_node adr = find_field(node, Field::PostalAddress, ns))
        parse_postal_address(adr, ns, p);
    return p;
}

// IBAN first, then Othr/Id, else empty
inline std::string parse_account_id(const pugi::xml_node& acct, const NamespaceContext& ns) {
    return field_text(acct, Field::AccountId, ns);
}

// BICFI/BIC, falling back to the clearing system member id
inline PaymentParty parse_agent(const pugi::xml_node& node, const NamespaceContext& ns) {
    PaymentParty a;
    a.bic = field_text(node, Field::AgentBic, ns);
    a.name = field_text(node, Field::AgentName, ns);
    a.country = field_text(node, Field::AgentCountry, ns);
    return a;
}

inline std::string parse_remittance(const pugi::xml_node& rmt) {
    std::string out;
    for (pugi::xml_node u = rmt.first_child(); u; u = u.next_sibling()) {
        if (!isln(u, "Ustrd")) continue;
        out = join_nonempty(out, txt(u), " ");
    }
    return out;
}

// IntrBkSttlmAmt, else InstdAmt; the currency is the Ccy attribute.
inline bool parse_amount(const pugi::xml_node& tx, const NamespaceContext& ns,
                         const CurrencyAllowList& currencies, PaymentAmount& out, Error* error) {
    pugi::xml_node amt = find_field(tx, Field::Amount, ns);
    if (!amt)
        return set_error(error, ErrorKind::SchemaValidation, "IntrBkSttlmAmt", "",
                         "Missing amount element (IntrBkSttlmAmt or InstdAmt)");

    const std::string field = ln(amt);
    const std::string text = txt(amt);
    Decimal value;
    if (!parse_decimal(text, value))
        return set_error(error, ErrorKind::SchemaValidation, field, text,
                         "Invalid amount format in " + field + ": '" + text + "'");

    const std::string code = attr_any(amt, "Ccy");
    if (!currencies.contains(code))
        return set_error(error, ErrorKind::CurrencyValidation, field + "/@Ccy", code,
                         "Invalid currency: '" + code + "'");

    out.value = value;
    out.currency = upper_trim(code);
    return true;
}

// ---------- Parser-Class ----------
class Parser {
public:
    Parser() = default;
    explicit Parser(ParserOptions options) : opt_(std::move(options)) {}

    const ParserOptions& options() const { return opt_; }

    bool parse_file(const std::string& path, PaymentInstruction& out, Error* error = nullptr) const {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in)
            return set_error(error, ErrorKind::MalformedXml, path, "", "Cannot open XML file");
        return parse_stream(in, out, error);
    }

    bool parse_stream(std::istream& is, PaymentInstruction& out, Error* error = nullptr) const {
        std::ostringstream buf;
        buf << is.rdbuf();
        return parse_string(buf.str(), out, error);
    }

    // out is written only when every required field was extracted.
    bool parse_string(std::string_view xml, PaymentInstruction& out, Error* error = nullptr) const {
        if (is_blank(xml))
            return set_error(error, ErrorKind::MalformedXml, "", "", "Empty XML string");
        if (xml.size() > opt_.max_message_bytes)
            return set_error(error, ErrorKind::MalformedXml, "", std::to_string(xml.size()),
                             "Message exceeds " + std::to_string(opt_.max_message_bytes) + " bytes");
        if (!is_valid_utf8(xml))
            return set_error(error, ErrorKind::MalformedXml, "", "", "Message is not valid UTF-8");

        std::string clean = sanitize_xml(xml);

        pugi::xml_document doc;
        // parse_default leaves DOCTYPE handling off and never resolves external entities
        pugi::xml_parse_result ok = doc.load_buffer(clean.data(), clean.size(),
                                                    pugi::parse_default, pugi::encoding_utf8);
        if (!ok)
            return set_error(error, ErrorKind::MalformedXml, "", std::to_string(ok.offset),
                             std::string("XML parse error: ") + ok.description());

        pugi::xml_node root = doc.document_element();
        if (!root)
            return set_error(error, ErrorKind::MalformedXml, "", "", "Empty document");

        const std::size_t depth = nesting_depth(root, opt_.max_depth);
        if (depth > opt_.max_depth)
            return set_error(error, ErrorKind::MalformedXml, ln(root), std::to_string(depth),
                             "Document nesting exceeds " + std::to_string(opt_.max_depth) + " levels");

        PaymentInstruction ins;
        if (!parse_doc(root, ins, error)) return false;
        ins.rawXml = std::move(clean);
        ins.parsedAt = std::chrono::system_clock::now();
        out = std::move(ins);
        return true;
    }

private:
    bool parse_doc(const pugi::xml_node& root, PaymentInstruction& ins, Error* error) const {
        const NamespaceContext ns = detect_namespace(root);

        pugi::xml_node tx = find_field(root, Field::Transaction, ns);
        if (!tx)
            return set_error(error, ErrorKind::SchemaValidation, "CdtTrfTxInf", "",
                             "Missing CdtTrfTxInf element");

        pugi::xml_node gh = find_field(root, Field::GroupHeader, ns);
        if (gh) {
            ins.messageId = field_text(gh, Field::MessageId, ns);
            ins.creationDateTime = field_text(gh, Field::CreationDateTime, ns);
        }

        ins.instructionId = field_text(tx, Field::InstructionId, ns);
        ins.endToEndId = field_text(tx, Field::EndToEndId, ns);
        ins.transactionId = field_text(tx, Field::TransactionId, ns);
        const std::string uetr = field_text(tx, Field::Uetr, ns);
        if (!uetr.empty()) ins.transactionId = uetr;

        if (!parse_amount(tx, ns, opt_.currencies, ins.amount, error)) return false;

        ins.settlementDate = field_text(tx, Field::SettlementDate, ns);
        if (ins.settlementDate.empty() && gh)
            ins.settlementDate = field_text(gh, Field::SettlementDate, ns);

        if (pugi::xml_node n = find_field(tx, Field::Debtor, ns))          ins.debtor = parse_party(n, ns);
        if (pugi::xml_node n = find_field(tx, Field::DebtorAccount, ns))   ins.debtor.accountId = parse_account_id(n, ns);
        if (pugi::xml_node n = find_field(tx, Field::DebtorAgent, ns))     ins.debtorAgent = parse_agent(n, ns);
        if (pugi::xml_node n = find_field(tx, Field::Creditor, ns))        ins.creditor = parse_party(n, ns);
        if (pugi::xml_node n = find_field(tx, Field::CreditorAccount, ns)) ins.creditor.accountId = parse_account_id(n, ns);
        if (pugi::xml_node n = find_field(tx, Field::CreditorAgent, ns))   ins.creditorAgent = parse_agent(n, ns);
        if (pugi::xml_node n = find_field(tx, Field::Remittance, ns))      ins.remittanceInfo = parse_remittance(n);

        return true;
    }

    ParserOptions opt_;
};

} // namespace pacs
