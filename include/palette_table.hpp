// ============================================================================
//  File: include/palette_table.hpp — Table de quantification 256 entrées
//  Project: E-Ink Gallery Renderer v1
//
//  • slot[i] = palette[i] pour i < count ; slots suivants à zéro.
//  • Ordre conservé tel quel (ni tri, ni dédoublonnage): les égalités de
//    distance et les consommateurs indexés dépendent de la position.
//  • Seuls les `count` premiers slots sont atteignables en sortie.
// ============================================================================

#pragma once
#include <array>
#include <vector>

#include "display_profile.hpp"

namespace EinkGallery
{

struct PaletteTable
{
    std::array<Rgb8, kMaxPaletteColors> slots{};
    int count = 0;
};

PaletteTable build_palette_table(const DisplayProfile& profile);
PaletteTable build_palette_table(const std::vector<Rgb8>& colors);

// Index du slot le plus proche (distance RGB euclidienne au carré, égalité →
// plus petit index). Entrées hors 0..255 tolérées (erreur de diffusion).
int nearest_palette_index(const PaletteTable& pal, int r, int g, int b);

} // namespace EinkGallery
