#include <gtest/gtest.h>

#include "sync/member_filter.hpp"

namespace {

using uisync::MemberFilter;
using uisync::MemberKind;

MemberFilter ParseOrDie(const char* text) {
    auto f = MemberFilter::Parse(text);
    EXPECT_TRUE(f.has_value()) << text << ": " << (f ? "" : f.error());
    return f ? *f : MemberFilter{};
}

TEST(MemberFilterTest, EmptySelectsEverything) {
    const MemberFilter f = ParseOrDie("");
    EXPECT_TRUE(f.Empty());
    EXPECT_TRUE(f.ModelNames().empty());
    EXPECT_TRUE(f.IncludesRecord(MemberKind::Ui, "Any"));
    EXPECT_TRUE(f.IncludesRecord(MemberKind::Pml, "Any"));
    EXPECT_TRUE(f.IncludesDefinition("Any", "Def"));
}

TEST(MemberFilterTest, KindPrefixes) {
    const MemberFilter f = ParseOrDie("config-ui:Cato:Main, pml:Octa,ui:Lima");
    EXPECT_EQ(f.ModelNames(), (std::vector<std::string>{"Cato", "Octa", "Lima"}));

    EXPECT_TRUE(f.IncludesRecord(MemberKind::Ui, "Cato"));
    EXPECT_FALSE(f.IncludesRecord(MemberKind::Pml, "Cato"));
    EXPECT_TRUE(f.IncludesDefinition("Cato", "Main"));
    EXPECT_FALSE(f.IncludesDefinition("Cato", "Other"));

    EXPECT_TRUE(f.IncludesRecord(MemberKind::Pml, "Octa"));
    EXPECT_FALSE(f.IncludesRecord(MemberKind::Ui, "Octa"));
    EXPECT_FALSE(f.IncludesDefinition("Octa", "Main"));

    EXPECT_TRUE(f.IncludesDefinition("Lima", "Anything"));
    EXPECT_FALSE(f.IncludesRecord(MemberKind::Ui, "Unlisted"));
}

TEST(MemberFilterTest, BareMemberSelectsBothKinds) {
    const MemberFilter f = ParseOrDie("Cato:Main,Octa");
    EXPECT_TRUE(f.IncludesRecord(MemberKind::Ui, "Cato"));
    EXPECT_TRUE(f.IncludesRecord(MemberKind::Pml, "Cato"));
    EXPECT_TRUE(f.IncludesDefinition("Cato", "Main"));
    EXPECT_FALSE(f.IncludesDefinition("Cato", "Second"));
    EXPECT_TRUE(f.IncludesDefinition("Octa", "Second"));
}

TEST(MemberFilterTest, MembersForSameModelCombine) {
    const MemberFilter f = ParseOrDie("ui:Cato:A,ui:Cato:B");
    EXPECT_EQ(f.ModelNames(), (std::vector<std::string>{"Cato"}));
    EXPECT_TRUE(f.IncludesDefinition("Cato", "A"));
    EXPECT_TRUE(f.IncludesDefinition("Cato", "B"));
    EXPECT_FALSE(f.IncludesDefinition("Cato", "C"));
}

TEST(MemberFilterTest, RejectsMalformedMembers) {
    EXPECT_FALSE(MemberFilter::Parse("ui:").has_value());
    EXPECT_FALSE(MemberFilter::Parse("pml:Cato:Main").has_value());
    EXPECT_FALSE(MemberFilter::Parse("ui:Cato:Main:Extra").has_value());
    EXPECT_FALSE(MemberFilter::Parse("Cato:").has_value());
    EXPECT_TRUE(MemberFilter::Parse(" , ,").has_value());
}

} // namespace
