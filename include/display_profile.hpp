// ============================================================================
//  File: include/display_profile.hpp — Profil de panneau e-ink (DOC+)
//  Project: E-Ink Gallery Renderer v1
//
//  OBJET
//  -----
//  • Résolution, palette ordonnée et gamma d’un panneau.
//  • Validé une seule fois, à la construction: un DisplayProfile obtenu via
//    parse()/create() respecte toujours les invariants ci-dessous.
//
//  INVARIANTS
//  ----------
//  • name ∈ [A-Za-z0-9_-]+
//  • 0 < width,height ≤ kMaxPanelSide
//  • 1 ≤ |palette| ≤ 256, canaux 0..255 (ordre significatif)
//  • gamma > 0 (1.0 = identité)
//
//  FORMAT TEXTE (.json, commentaires // acceptés)
//  ----------------------------------------------
//   {
//     "resolution":    { "width": 800, "height": 480 },
//     "color_mapping": { "palette": [[0,0,0],[255,255,255]] },
//     "gamma": 1.0
//   }
// ============================================================================

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gallery_error.hpp"

namespace EinkGallery
{

constexpr int         kMaxPaletteColors = 256;
constexpr int         kMaxPanelSide     = 16384;
constexpr const char* kProfileExtension = ".json";

struct Rgb8
{
    uint8_t r=0, g=0, b=0;
};
inline bool operator==(const Rgb8& a, const Rgb8& b)
{
    return a.r==b.r && a.g==b.g && a.b==b.b;
}
inline bool operator!=(const Rgb8& a, const Rgb8& b)
{
    return !(a==b);
}

// Identifiant de profil / nom de fichier sans extension.
bool is_valid_profile_name(const std::string& name);

class DisplayProfile
{
public:
    // Analyse le texte d’un fichier profil. `name` sert aussi à nommer le
    // fichier fautif dans le message InvalidConfig.
    static std::optional<DisplayProfile> parse(const std::string& name,
                                               const std::string& raw,
                                               GalleryError* err = nullptr);

    static std::optional<DisplayProfile> create(const std::string& name,
                                                int width, int height,
                                                const std::vector<Rgb8>& palette,
                                                double gamma = 1.0,
                                                GalleryError* err = nullptr);

    const std::string&       name()    const { return name_; }
    int                      width()   const { return width_; }
    int                      height()  const { return height_; }
    const std::vector<Rgb8>& palette() const { return palette_; }
    double                   gamma()   const { return gamma_; }

    // Forme canonique (pour `show` et les tests).
    std::string to_json_text() const;

private:
    DisplayProfile() = default;

    std::string       name_;
    int               width_  = 0;
    int               height_ = 0;
    std::vector<Rgb8> palette_;
    double            gamma_  = 1.0;
};

} // namespace EinkGallery
