// clang-format off
/*
 * DDMerge - Directory Diff And Merge Tool
 *
 * SPDX-FileCopyrightText: 2018-2020 Michael Reeves reeves.87@gmail.com
 * SPDX-License-Identifier: GPL-2.0-or-later
*/
// clang-format on

#ifndef DIFFENTRY_H
#define DIFFENTRY_H

#include <optional>
#include <vector>

#include <QDebug>
#include <QString>

enum class e_DiffKind
{
    LeftOnly,
    RightOnly,
    Modified,
    TypeMismatch
};

/*
    Classification of one path that differs between two folder trees.
    The folder flags are only present for sides where the path exists.
*/
class DiffEntry
{
  public:
    DiffEntry() = default;

    [[nodiscard]] static DiffEntry leftOnly(const QString& path, bool bDir) { return DiffEntry(path, e_DiffKind::LeftOnly, bDir, std::nullopt); }
    [[nodiscard]] static DiffEntry rightOnly(const QString& path, bool bDir) { return DiffEntry(path, e_DiffKind::RightOnly, std::nullopt, bDir); }
    [[nodiscard]] static DiffEntry modified(const QString& path) { return DiffEntry(path, e_DiffKind::Modified, false, false); }
    [[nodiscard]] static DiffEntry typeMismatch(const QString& path, bool bDirLeft)
    {
        return DiffEntry(path, e_DiffKind::TypeMismatch, bDirLeft, !bDirLeft);
    }

    [[nodiscard]] const QString& path() const { return m_path; }
    [[nodiscard]] e_DiffKind kind() const { return m_kind; }
    [[nodiscard]] std::optional<bool> isDirLeft() const { return m_bDirLeft; }
    [[nodiscard]] std::optional<bool> isDirRight() const { return m_bDirRight; }

    // For one sided entries: whether the existing side is a folder.
    [[nodiscard]] bool isDir() const { return m_bDirLeft.value_or(false) || m_bDirRight.value_or(false); }
    [[nodiscard]] bool isOneSided() const { return m_kind == e_DiffKind::LeftOnly || m_kind == e_DiffKind::RightOnly; }

    [[nodiscard]] bool hasError() const { return !m_errorText.isEmpty(); }
    [[nodiscard]] const QString& errorText() const { return m_errorText; }
    void setErrorText(const QString& text) { m_errorText = text; }

    bool operator==(const DiffEntry& other) const
    {
        return m_path == other.m_path && m_kind == other.m_kind &&
               m_bDirLeft == other.m_bDirLeft && m_bDirRight == other.m_bDirRight;
    }
    bool operator!=(const DiffEntry& other) const { return !(*this == other); }

  private:
    DiffEntry(const QString& path, e_DiffKind kind, std::optional<bool> bDirLeft, std::optional<bool> bDirRight):
        m_path(path), m_kind(kind), m_bDirLeft(bDirLeft), m_bDirRight(bDirRight)
    {
    }

    QString m_path;
    e_DiffKind m_kind = e_DiffKind::Modified;
    std::optional<bool> m_bDirLeft;
    std::optional<bool> m_bDirRight;
    QString m_errorText;
};

using DiffEntryList = std::vector<DiffEntry>;

inline QDebug operator<<(QDebug debug, const DiffEntry& entry)
{
    static const char* const kindNames[] = {"LeftOnly", "RightOnly", "Modified", "TypeMismatch"};

    QDebugStateSaver saver(debug);
    debug.nospace() << kindNames[(int)entry.kind()] << '(' << entry.path() << ')';
    return debug;
}

#endif
