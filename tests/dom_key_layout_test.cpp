#include <gtest/gtest.h>

#include "platform/web/dom_key_layout.h"

using namespace dscope;

namespace
{
Key ResolveDom(const char* code)
{
    DomKeyLayout layout;
    return layout.Resolve(DomKeyLayout::CodeFromDom(code));
}
} // namespace

TEST(DomKeyLayout, LettersDigitsAndNamedKeys)
{
    EXPECT_EQ(ResolveDom("KeyA"), Key::A);
    EXPECT_EQ(ResolveDom("KeyZ"), Key::Z);
    EXPECT_EQ(ResolveDom("Digit7"), Key::Num7);
    EXPECT_EQ(ResolveDom("Enter"), Key::Enter);
    EXPECT_EQ(ResolveDom("NumpadEnter"), Key::KeypadEnter);
    EXPECT_EQ(ResolveDom("Home"), Key::Home);
    EXPECT_EQ(ResolveDom("Quote"), Key::Apostrophe);
}

TEST(DomKeyLayout, LegacyMetaNames)
{
    EXPECT_EQ(ResolveDom("MetaLeft"), Key::LeftSuper);
    EXPECT_EQ(ResolveDom("OSLeft"), Key::LeftSuper);
    EXPECT_EQ(ResolveDom("OSRight"), Key::RightSuper);
}

TEST(DomKeyLayout, UnknownCodesResolveToNone)
{
    EXPECT_EQ(DomKeyLayout::CodeFromDom("IntlRo"), 0u);
    EXPECT_EQ(DomKeyLayout::CodeFromDom(""), 0u);
    DomKeyLayout layout;
    EXPECT_EQ(layout.Resolve(0), Key::None);
    EXPECT_EQ(layout.Resolve(100000), Key::None);
}

TEST(DomKeyLayout, CodesAreNonZero)
{
    EXPECT_NE(DomKeyLayout::CodeFromDom("KeyA"), 0u);
    EXPECT_NE(DomKeyLayout::CodeFromDom("KeyA"), DomKeyLayout::CodeFromDom("KeyB"));
}
