// =====================================================================
//  src/liblasercam/toolpath/coalescer.cpp — Instruction coalescer
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <lasercam/toolpath/coalescer.h>
#include <lasercam/geometry/utils.h>

#include <QtMath>

namespace lasercam {
namespace toolpath {

namespace {

/// Sine of the bend angle below which three points count as collinear
constexpr double COLLINEAR_TOLERANCE = 1e-9;

}  // anonymous namespace

InstructionCoalescer::InstructionCoalescer(Program& program)
    : m_program(program)
{
}

void InstructionCoalescer::moveTo(std::optional<double> x, std::optional<double> y,
                                  int power, double feedRate)
{
    const int decimals = m_program.decimals();

    Target next;
    next.x = geometry::roundTo(x ? *x : (m_pending ? m_pending->x : m_lastX.value_or(0.0)), decimals);
    next.y = geometry::roundTo(y ? *y : (m_pending ? m_pending->y : m_lastY.value_or(0.0)), decimals);
    next.power = power < 0 ? 0 : power;
    next.feedRate = feedRate;

    if (m_pending) {
        if (m_pending->power == next.power && qFuzzyCompare(m_pending->feedRate, next.feedRate)
            && continuesPending(next)) {
            m_pending = next;
            return;
        }
        write(*m_pending);
    }
    m_pending = next;
}

void InstructionCoalescer::flush()
{
    if (m_pending) {
        write(*m_pending);
        m_pending.reset();
    }
}

void InstructionCoalescer::reset()
{
    flush();
    m_lastX.reset();
    m_lastY.reset();
    m_lastFeed.reset();
}

bool InstructionCoalescer::continuesPending(const Target& next) const
{
    // Nothing written yet: the first position must be written as given
    if (!m_lastX || !m_lastY) {
        return false;
    }

    const QPointF last(*m_lastX, *m_lastY);
    const QPointF pending(m_pending->x, m_pending->y);
    const QPointF target(next.x, next.y);

    const QPointF d1 = pending - last;
    const QPointF d2 = target - pending;
    const double l1 = geometry::length(d1);
    const double l2 = geometry::length(d2);

    if (next.power == 0 || l1 == 0.0 || l2 == 0.0) {
        return true;
    }
    if (qAbs(geometry::cross(d1, d2)) > COLLINEAR_TOLERANCE * l1 * l2) {
        return false;
    }
    // Same direction only; a reversal is a real turn-around
    return geometry::dot(d1, d2) > 0.0;
}

void InstructionCoalescer::write(const Target& target)
{
    Instruction instruction;
    instruction.op = target.power == 0 ? MotionOp::Rapid : MotionOp::Cut;

    if (!m_lastX || *m_lastX != target.x) {
        instruction.x = target.x;
    }
    if (!m_lastY || *m_lastY != target.y) {
        instruction.y = target.y;
    }
    // No motion, nothing to write
    if (!instruction.x && !instruction.y) {
        return;
    }

    if (instruction.op == MotionOp::Cut) {
        instruction.power = target.power;
    }
    if (!m_lastFeed || !qFuzzyCompare(*m_lastFeed, target.feedRate)) {
        instruction.feedRate = target.feedRate;
        m_lastFeed = target.feedRate;
    }

    m_lastX = target.x;
    m_lastY = target.y;
    m_program.addMotion(instruction);
    ++m_written;
}

}  // namespace toolpath
}  // namespace lasercam
