// =====================================================================
//  src/liblasercam/toolpath/program.cpp — Instruction programs
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/toolpath/program.h>
#include <lasercam/geometry/utils.h>

namespace lasercam {
namespace toolpath {

Program::Program(int decimals)
    : m_decimals(decimals)
{
}

void Program::addComment(const QString& text)
{
    ProgramLine line;
    line.kind = ProgramLine::Kind::Comment;
    line.text = text;
    m_lines.append(line);
}

void Program::addCommand(const QString& text)
{
    ProgramLine line;
    line.kind = ProgramLine::Kind::Command;
    line.text = text;
    m_lines.append(line);
}

void Program::addMotion(const Instruction& instruction)
{
    ProgramLine line;
    line.kind = ProgramLine::Kind::Motion;
    line.motion = instruction;
    m_lines.append(line);
}

void Program::addBlank()
{
    m_lines.append(ProgramLine());
}

QVector<Instruction> Program::motions() const
{
    QVector<Instruction> result;
    for (const ProgramLine& line : m_lines) {
        if (line.kind == ProgramLine::Kind::Motion) {
            result.append(line.motion);
        }
    }
    return result;
}

int Program::cutCount() const
{
    int count = 0;
    for (const ProgramLine& line : m_lines) {
        if (line.kind == ProgramLine::Kind::Motion && line.motion.op == MotionOp::Cut) {
            ++count;
        }
    }
    return count;
}

QVector<QPointF> Program::tracePositions() const
{
    QVector<QPointF> positions;
    QPointF current(0, 0);
    for (const ProgramLine& line : m_lines) {
        if (line.kind != ProgramLine::Kind::Motion) continue;
        if (line.motion.x) current.setX(*line.motion.x);
        if (line.motion.y) current.setY(*line.motion.y);
        positions.append(current);
    }
    return positions;
}

QString Program::formatMotion(const Instruction& instruction, int decimals)
{
    QString text = instruction.op == MotionOp::Cut ? QStringLiteral("G1")
                                                   : QStringLiteral("G0");
    if (instruction.x) {
        text += QStringLiteral(" X") + geometry::formatNumber(*instruction.x, decimals);
    }
    if (instruction.y) {
        text += QStringLiteral(" Y") + geometry::formatNumber(*instruction.y, decimals);
    }
    if (instruction.op == MotionOp::Cut) {
        text += QStringLiteral(" S") + QString::number(instruction.power.value_or(0));
    }
    if (instruction.feedRate) {
        text += QStringLiteral(" F") + geometry::formatNumber(*instruction.feedRate, 0);
    }
    return text;
}

QString Program::toText() const
{
    QStringList out;
    out.reserve(m_lines.size());
    for (const ProgramLine& line : m_lines) {
        switch (line.kind) {
        case ProgramLine::Kind::Comment:
            out.append(line.text.isEmpty() ? QStringLiteral(";")
                                           : QStringLiteral("; ") + line.text);
            break;
        case ProgramLine::Kind::Command:
            out.append(line.text);
            break;
        case ProgramLine::Kind::Motion:
            out.append(formatMotion(line.motion, m_decimals));
            break;
        case ProgramLine::Kind::Blank:
            out.append(QString());
            break;
        }
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

}  // namespace toolpath
}  // namespace lasercam
