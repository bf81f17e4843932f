// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/contextmenu/ContextMenuAction.hpp"

TEST(ContextMenuTests, ItemCarriesIdTextAndEnabledState)
{
    const auto action = Utils::ContextMenuAction::item(QStringLiteral("action.first"),
                                                       QStringLiteral("First"),
                                                       false);
    EXPECT_EQ(action.id, QStringLiteral("action.first"));
    EXPECT_EQ(action.text, QStringLiteral("First"));
    EXPECT_FALSE(action.enabled);
    EXPECT_FALSE(action.isSeparator);
}

TEST(ContextMenuTests, SeparatorsAreNotSelectable)
{
    QList<Utils::ContextMenuAction> specs;
    specs.push_back(Utils::ContextMenuAction::item(QStringLiteral("action.first"), QStringLiteral("First")));
    specs.push_back(Utils::ContextMenuAction::separatorAction());
    specs.push_back(Utils::ContextMenuAction::item(QStringLiteral("action.second"), QStringLiteral("Second")));

    EXPECT_EQ(Utils::selectableActionCount(specs), 2);
}

TEST(ContextMenuTests, FindActionLooksUpById)
{
    QList<Utils::ContextMenuAction> specs;
    specs.push_back(Utils::ContextMenuAction::item(QStringLiteral("action.first"), QStringLiteral("First")));
    specs.push_back(Utils::ContextMenuAction::separatorAction());

    const auto* found = Utils::findAction(specs, QStringLiteral("action.first"));
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->text, QStringLiteral("First"));

    EXPECT_EQ(Utils::findAction(specs, QStringLiteral("action.missing")), nullptr);
    EXPECT_EQ(Utils::findAction(specs, QString()), nullptr);
}
