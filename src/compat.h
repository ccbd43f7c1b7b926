// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2023 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef COMPAT_H
#define COMPAT_H

/*
    KF5I18n rightfully complains if included in the auto-test builds as they aren't actually setup
    for translations. Callers must not rely on %n substitution in that configuration.
*/
#ifndef AUTOTEST
#include <KLocalizedString>
#else
#define i18n(expr, ...) QString::fromUtf8(expr)
#define i18nc(c, expr, ...) QString::fromUtf8(expr)
#endif

#endif /* COMPAT_H */
