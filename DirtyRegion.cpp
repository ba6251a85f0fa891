#include "DirtyRegion.h"
#include <algorithm>

size_t TileMask::Count() const {
    return static_cast<size_t>(std::count(dirty.begin(), dirty.end(), true));
}

TileMask DiffTiles(const Frame& cur, const Frame& prev, int tile) {
    TileMask mask;
    mask.tile = tile;
    mask.columns = (cur.Width() + tile - 1) / tile;
    mask.rows = (cur.Height() + tile - 1) / tile;
    mask.dirty.assign(static_cast<size_t>(mask.columns) * mask.rows, false);

    const Rect bounds = cur.Bounds();
    for (int y = 0; y < cur.Height(); ++y) {
        const color_t* a = cur.Row(y);
        const color_t* b = prev.Row(y);
        const size_t base = static_cast<size_t>(y / tile) * mask.columns;
        for (int column = 0; column < mask.columns; ++column) {
            if (mask.dirty[base + column]) continue;
            Rect span = Intersect(Rect{column * tile, y, tile, 1}, bounds);
            if (!std::equal(a + span.x, a + span.x + span.w, b + span.x)) {
                mask.dirty[base + column] = true;
            }
        }
    }
    return mask;
}

namespace {

// A rectangle of tiles, inclusive.
struct TileSpan {
    int first_column;
    int last_column;
    int first_row;
    int last_row;
};

} // namespace

std::vector<Rect> MergeTiles(const TileMask& mask, const Rect& bounds) {
    std::vector<TileSpan> spans;
    std::vector<size_t> open;  // spans that reached the previous row

    for (int row = 0; row < mask.rows; ++row) {
        std::vector<size_t> next_open;
        int column = 0;
        while (column < mask.columns) {
            if (!mask.At(column, row)) {
                ++column;
                continue;
            }
            int first = column;
            while (column < mask.columns && mask.At(column, row)) ++column;
            int last = column - 1;

            auto same = std::find_if(open.begin(), open.end(), [&](size_t i) {
                return spans[i].first_column == first && spans[i].last_column == last;
            });
            if (same != open.end()) {
                spans[*same].last_row = row;
                next_open.push_back(*same);
            } else {
                spans.push_back(TileSpan{first, last, row, row});
                next_open.push_back(spans.size() - 1);
            }
        }
        open.swap(next_open);
    }

    std::vector<Rect> rects;
    rects.reserve(spans.size());
    for (const auto& s : spans) {
        Rect r{s.first_column * mask.tile, s.first_row * mask.tile,
               (s.last_column - s.first_column + 1) * mask.tile,
               (s.last_row - s.first_row + 1) * mask.tile};
        r = Intersect(r, bounds);
        if (!r.Empty()) rects.push_back(r);
    }
    return rects;
}

DirtyResult ComputeDirtyRegion(const Frame& cur, const Frame* prev, const DirtyOptions& options) {
    DirtyResult result;
    const size_t screen_area = static_cast<size_t>(cur.Width()) * cur.Height();
    auto send_all = [&]() {
        result.full_frame = true;
        result.rects.clear();
        result.dirty_area = screen_area;
        return result;
    };
    if (!prev || !prev->SameSize(cur) || options.tile <= 0) return send_all();

    TileMask mask = DiffTiles(cur, *prev, options.tile);
    if (mask.Count() == 0) return result;

    result.rects = MergeTiles(mask, cur.Bounds());
    for (const auto& r : result.rects) {
        result.dirty_area += static_cast<size_t>(r.w) * r.h;
    }
    double ratio = screen_area > 0 ? static_cast<double>(result.dirty_area) / screen_area : 1.0;
    if (ratio > options.full_frame_threshold || static_cast<int>(result.rects.size()) > options.max_rects) {
        return send_all();
    }
    return result;
}
