// ============================================================================
//  File: include/frame_service.hpp — Contexte de rendu des cadres (DOC+)
//  Project: E-Ink Gallery Renderer v1
//
//  OBJET
//  -----
//  • Objet de contexte explicite, construit une fois par l’outil et passé
//    par référence: stockage des profils, catalogue d’images, pool de rendu,
//    générateur aléatoire. Aucun singleton.
//  • Trois surfaces de rendu:
//      render_upload({panel, crop, source})           → PNG
//      render_named(panel, filename, crop)            → PNG
//      render_selection({panel, policy, tags, index}) → {filename, index?, PNG}
//  • Le rendu (CPU) s’exécute sur un worker du RenderPool; l’appelant attend
//    le résultat.
//
//  ERREURS
//  -------
//  • Panneau inconnu → NotFound avec `available` = profils connus.
//  • Image inconnue  → NotFound. Octets illisibles → DecodeError.
// ============================================================================

#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "gallery_error.hpp"
#include "image_catalog.hpp"
#include "image_selector.hpp"
#include "profile_store.hpp"
#include "render_pipeline.hpp"
#include "render_pool.hpp"

namespace EinkGallery
{

struct UploadRequest
{
    std::string          panel;
    bool                 crop = true;
    std::vector<uint8_t> source;
};

struct SelectionRenderRequest
{
    std::string               panel;
    SelectionPolicy           policy = SelectionPolicy::Random;
    std::vector<std::string>  tag_filter;
    std::optional<long long>  current_index;
    bool                      crop = true;
};

struct SelectionRender
{
    std::string              filename;
    std::optional<long long> index;
    std::vector<uint8_t>     png;
};

class FrameService
{
public:
    FrameService(ProfileStore& profiles, const ImageCatalog& catalog, RenderPool& pool,
                 bool dither = true);

    bool render_upload(const UploadRequest& req, std::vector<uint8_t>& png,
                       GalleryError* err = nullptr);
    bool render_named(const std::string& panel, const std::string& filename, bool crop,
                      std::vector<uint8_t>& png, GalleryError* err = nullptr);
    bool render_selection(const SelectionRenderRequest& req, SelectionRender& out,
                          GalleryError* err = nullptr);

    // Sélection seule (sans rendu).
    bool select(const SelectionRequest& req, SelectionResult& out, GalleryError* err = nullptr);

    ProfileStore&       profiles()
    {
        return profiles_;
    }
    const ImageCatalog& catalog() const
    {
        return catalog_;
    }

    void seed(std::mt19937::result_type s);

private:
    bool render_bytes(const std::string& panel, const std::vector<uint8_t>& bytes, bool crop,
                      std::vector<uint8_t>& png, GalleryError* err);

    ProfileStore&        profiles_;
    const ImageCatalog&  catalog_;
    RenderPool&          pool_;
    bool                 dither_;
    std::mutex           rng_mu_;
    std::mt19937         rng_;
};

} // namespace EinkGallery
