// ============================================================================
//  File: include/image_selector.hpp — Choix de l’image suivante (DOC+)
//  Project: E-Ink Gallery Renderer v1
//
//  POLITIQUES
//  ----------
//  • Random : tirage uniforme dans l’ensemble éligible (rng fourni).
//  • Next   : (current_index + 1) mod |éligible|, modulo non négatif.
//             L’index est relu contre l’ensemble éligible courant: si la
//             collection change entre deux appels, il désigne une autre image.
//
//  FILTRE TAGS
//  -----------
//  • OU logique: éligible si au moins un tag de l’image figure dans le filtre.
//  • Termes trim + minuscules; termes vides ignorés; filtre vide = pas de filtre.
// ============================================================================

#pragma once
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "gallery_error.hpp"
#include "image_catalog.hpp"

namespace EinkGallery
{

enum class SelectionPolicy : unsigned char { Random=0, Next=1 };

const char* selection_policy_name(SelectionPolicy p);
bool        parse_selection_policy(const std::string& s, SelectionPolicy& out);

struct SelectionRequest
{
    SelectionPolicy           policy = SelectionPolicy::Random;
    std::vector<std::string>  tag_filter;
    std::optional<long long>  current_index;
};

struct SelectionResult
{
    ImageRecord               image;
    std::optional<long long>  index; // Next uniquement
};

// "a, B ,,c" → {"a","b","c"}
std::vector<std::string> parse_tag_filter(const std::string& csv);

// Sous-séquence éligible, ordre de la collection conservé.
std::vector<ImageRecord> filter_by_tags(const std::vector<ImageRecord>& images,
                                        const std::vector<std::string>& tag_filter);

bool select_from(const std::vector<ImageRecord>& images,
                 const SelectionRequest& req,
                 std::mt19937& rng,
                 SelectionResult& out,
                 GalleryError* err = nullptr);

// Relit la collection au moment de l’appel puis délègue à select_from().
bool select_image(const ImageCatalog& catalog,
                  const SelectionRequest& req,
                  std::mt19937& rng,
                  SelectionResult& out,
                  GalleryError* err = nullptr);

} // namespace EinkGallery
