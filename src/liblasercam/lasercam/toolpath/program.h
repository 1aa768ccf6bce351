// =====================================================================
//  src/liblasercam/lasercam/toolpath/program.h — Instruction programs
// =====================================================================
//
//  Abstract motion instructions and the line-oriented program the
//  emitters build from them.  A program is serialized to G-code text
//  only at the very end, so tests and hosts can inspect the motion
//  without parsing text.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_TOOLPATH_PROGRAM_H
#define LASERCAM_TOOLPATH_PROGRAM_H

#include "../core.h"

#include <QPointF>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

namespace lasercam {
namespace toolpath {

/// Motion kind, chosen solely from the power of the move
enum class MotionOp {
    Rapid,      ///< G0, laser off, never carries a power
    Cut         ///< G1, always carries a power
};

/// One motion instruction
///
/// Components that did not change since the previous instruction are
/// left empty and are not written.
struct LASERCAM_EXPORT Instruction {
    MotionOp op = MotionOp::Rapid;
    std::optional<double> x;
    std::optional<double> y;
    std::optional<int> power;          ///< Set for every Cut, never for Rapid
    std::optional<double> feedRate;    ///< Set only when the feed changes
};

/// One line of a program
struct LASERCAM_EXPORT ProgramLine {
    enum class Kind {
        Comment,    ///< "; text"
        Command,    ///< Literal machine command such as "M5 ; Disable laser"
        Motion,     ///< Serialized from `motion`
        Blank
    };

    Kind kind = Kind::Blank;
    QString text;
    Instruction motion;
};

/// An ordered instruction program
class LASERCAM_EXPORT Program {
public:
    /// @param decimals Coordinate decimals used when serializing motion
    explicit Program(int decimals = 3);

    int decimals() const { return m_decimals; }

    void addComment(const QString& text);
    void addCommand(const QString& text);
    void addMotion(const Instruction& instruction);
    void addBlank();

    const QVector<ProgramLine>& lines() const { return m_lines; }

    /// Motion instructions only, in order
    QVector<Instruction> motions() const;

    /// Number of Cut instructions
    int cutCount() const;

    /// Absolute tool position after each motion instruction, carrying
    /// omitted components forward from the previous one (starting at 0,0)
    QVector<QPointF> tracePositions() const;

    /// G-code text, one line per entry, joined with '\n'
    QString toText() const;

    /// Serialize a single motion instruction ("G1 X10 Y2.5 S50 F1000")
    static QString formatMotion(const Instruction& instruction, int decimals);

private:
    int m_decimals;
    QVector<ProgramLine> m_lines;
};

}  // namespace toolpath
}  // namespace lasercam

#endif  // LASERCAM_TOOLPATH_PROGRAM_H
