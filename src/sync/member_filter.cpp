#include "sync/member_filter.hpp"

#include <algorithm>

namespace uisync {

namespace {

bool HasKind(MemberKind set, MemberKind kind) {
    return (static_cast<unsigned>(set) & static_cast<unsigned>(kind)) != 0;
}

std::optional<MemberKind> KindFromPrefix(std::string_view s) {
    if (s == "ui" || s == "config-ui") return MemberKind::Ui;
    if (s == "pml") return MemberKind::Pml;
    return std::nullopt;
}

std::string_view Trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

std::vector<std::string_view> Split(std::string_view s, char sep) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        const size_t pos = s.find(sep, start);
        parts.push_back(s.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return parts;
}

Expected<Member> ParseMember(std::string_view text) {
    std::vector<std::string_view> parts = Split(text, ':');
    if (parts.size() > 3)
        return std::unexpected("too many ':' in member '" + std::string(text) + "'");

    Member m;
    if (parts.size() >= 2) {
        if (auto kind = KindFromPrefix(parts[0])) {
            m.kind = *kind;
            parts.erase(parts.begin());
        }
    }
    if (parts.size() > 2)
        return std::unexpected("too many ':' in member '" + std::string(text) + "'");

    m.model = std::string(Trim(parts[0]));
    if (m.model.empty())
        return std::unexpected("member without model name: '" + std::string(text) + "'");

    if (parts.size() == 2) {
        if (m.kind == MemberKind::Pml)
            return std::unexpected("pml member cannot name a UI definition: '" + std::string(text) + "'");
        const std::string_view def = Trim(parts[1]);
        if (def.empty())
            return std::unexpected("empty UI definition name in member '" + std::string(text) + "'");
        m.definition = std::string(def);
    }
    return m;
}

} // namespace

Expected<MemberFilter> MemberFilter::Parse(std::string_view members) {
    MemberFilter filter;
    for (std::string_view item : Split(members, ',')) {
        item = Trim(item);
        if (item.empty()) continue;
        auto m = ParseMember(item);
        if (!m) return std::unexpected(m.error());
        filter.members_.push_back(std::move(*m));
    }
    return filter;
}

std::vector<std::string> MemberFilter::ModelNames() const {
    std::vector<std::string> names;
    for (const auto& m : members_) {
        if (std::find(names.begin(), names.end(), m.model) == names.end()) {
            names.push_back(m.model);
        }
    }
    return names;
}

bool MemberFilter::IncludesRecord(MemberKind kind, const std::string& model) const {
    if (members_.empty()) return true;
    return std::any_of(members_.begin(), members_.end(), [&](const Member& m) {
        return m.model == model && HasKind(m.kind, kind);
    });
}

bool MemberFilter::IncludesDefinition(const std::string& model, const std::string& definition) const {
    if (members_.empty()) return true;
    return std::any_of(members_.begin(), members_.end(), [&](const Member& m) {
        return m.model == model && HasKind(m.kind, MemberKind::Ui) &&
               (!m.definition || *m.definition == definition);
    });
}

} // namespace uisync
