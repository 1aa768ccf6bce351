// =====================================================================
//  src/liblasercam/lasercam/toolpath/coalescer.h — Instruction coalescer
// =====================================================================
//
//  Sits between an emitter and its program.  The emitter requests a
//  move for every pixel or path point; the coalescer holds the latest
//  request back until it knows whether the next one continues it.
//
//    - A cutting request with the same power and feed whose predecessor
//      lies on the straight line between the last written position and
//      the new target replaces that predecessor (raster runs collapse,
//      corners survive).  Consecutive rapids at the same feed collapse
//      to the last target.
//    - Zero power is written as G0 without S; any other power as G1
//      with S.
//    - X / Y components equal to the last written ones are omitted, and
//      F is written only when it changes.
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_TOOLPATH_COALESCER_H
#define LASERCAM_TOOLPATH_COALESCER_H

#include "program.h"

namespace lasercam {
namespace toolpath {

class LASERCAM_EXPORT InstructionCoalescer {
public:
    /// @param program Program receiving the written instructions; must
    ///                outlive the coalescer
    explicit InstructionCoalescer(Program& program);

    /// Request a move; an empty component keeps the current value
    void moveTo(std::optional<double> x, std::optional<double> y,
                int power, double feedRate);

    /// Write the held-back move, if any
    void flush();

    /// Forget the machine state (next move writes X, Y and F in full)
    void reset();

    /// Number of instructions written so far
    int written() const { return m_written; }

private:
    struct Target {
        double x = 0.0;
        double y = 0.0;
        int power = 0;
        double feedRate = 0.0;
    };

    bool continuesPending(const Target& next) const;
    void write(const Target& target);

    Program& m_program;

    std::optional<double> m_lastX;
    std::optional<double> m_lastY;
    std::optional<double> m_lastFeed;

    std::optional<Target> m_pending;
    int m_written = 0;
};

}  // namespace toolpath
}  // namespace lasercam

#endif  // LASERCAM_TOOLPATH_COALESCER_H
