#pragma once

#include "util/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uisync {

enum class MemberKind : unsigned {
    Ui  = 1u << 0,
    Pml = 1u << 1,
    All = Ui | Pml,
};

struct Member {
    MemberKind kind = MemberKind::All;
    std::string model;
    std::optional<std::string> definition;  // Ui only
};

// Selection of records and UI definitions, parsed from a comma-separated list
// of `[kind:]model[:definition]` members:
//
//   config-ui:Cato:Main   UI definition "Main" of model Cato
//   ui:Cato               every UI definition of Cato
//   pml:Cato              PML content of Cato
//   Cato:Main             both kinds of Cato, UI definition "Main" only
//   Cato                  both kinds of Cato
//
// An empty filter selects everything.
class MemberFilter {
public:
    static Expected<MemberFilter> Parse(std::string_view members);

    bool Empty() const { return members_.empty(); }
    const std::vector<Member>& Members() const { return members_; }

    // Distinct model names in first-seen order; empty means all models.
    std::vector<std::string> ModelNames() const;

    bool IncludesRecord(MemberKind kind, const std::string& model) const;
    bool IncludesDefinition(const std::string& model, const std::string& definition) const;

private:
    std::vector<Member> members_;
};

} // namespace uisync
