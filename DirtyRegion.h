#ifndef DIRTY_REGION_H
#define DIRTY_REGION_H

#include "Frame.h"
#include <cstddef>
#include <vector>

struct DirtyOptions {
    int tile = 16;
    int max_rects = 8;
    double full_frame_threshold = 0.6;
};

// One flag per tile of a frame, row-major. Edge tiles may be partial.
struct TileMask {
    int tile = 0;
    int columns = 0;
    int rows = 0;
    std::vector<bool> dirty;

    bool At(int column, int row) const { return dirty[static_cast<size_t>(row) * columns + column]; }
    size_t Count() const;
};

struct DirtyResult {
    bool full_frame = false;  // send everything
    std::vector<Rect> rects;  // otherwise these, possibly none
    size_t dirty_area = 0;
};

// Marks every tile in which `cur` and `prev` differ. Both frames must have the same size.
TileMask DiffTiles(const Frame& cur, const Frame& prev, int tile);

// Horizontal runs of dirty tiles, grown downwards while the next tile row repeats the
// same run. Rects are clipped to `bounds`.
std::vector<Rect> MergeTiles(const TileMask& mask, const Rect& bounds);

// Decides between a full blit, a set of partial blits, or nothing.
DirtyResult ComputeDirtyRegion(const Frame& cur, const Frame* prev, const DirtyOptions& options);

#endif // DIRTY_REGION_H
