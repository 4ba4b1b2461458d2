// ============================================================================
//  File: src/palette_table.cpp — Table de quantification 256 entrées
// ============================================================================

#include "palette_table.hpp"

#include <algorithm>
#include <limits>

namespace EinkGallery
{

PaletteTable build_palette_table(const std::vector<Rgb8>& colors)
{
    PaletteTable t;
    t.count = (int)std::min<size_t>(colors.size(), (size_t)kMaxPaletteColors);
    for(int i=0; i<t.count; ++i) t.slots[(size_t)i] = colors[(size_t)i];
    return t;
}

PaletteTable build_palette_table(const DisplayProfile& profile)
{
    return build_palette_table(profile.palette());
}

int nearest_palette_index(const PaletteTable& pal, int r, int g, int b)
{
    int best = -1;
    long long best_d = std::numeric_limits<long long>::max();
    for(int i=0; i<pal.count; ++i)
    {
        const Rgb8& c = pal.slots[(size_t)i];
        const long long dr = r - (int)c.r;
        const long long dg = g - (int)c.g;
        const long long db = b - (int)c.b;
        const long long d = dr*dr + dg*dg + db*db;
        if(d < best_d) // strict: premier index gagne
        {
            best_d = d;
            best = i;
        }
    }
    return best;
}

} // namespace EinkGallery
