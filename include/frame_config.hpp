// ============================================================================
//  File: include/frame_config.hpp — Configuration du service (DOC+)
//  Project: E-Ink Gallery Renderer v1
//
//  PRIORITÉ (croissante)
//  ---------------------
//   1. valeurs intégrées (ci-dessous)
//   2. fichier JSON (--config), commentaires // acceptés:
//        { "defaults_dir": "./displays", "overrides_dir": "./data/displays",
//          "images_dir": "./data/images", "catalog_index": "",
//          "workers": 0, "queue_capacity": 16, "dither": true,
//          "log_level": "info" }
//   3. environnement: EINK_DEFAULTS_DIR, EINK_OVERRIDES_DIR, EINK_IMAGES_DIR,
//      EINK_WORKERS, EINK_LOG_LEVEL
//   4. options CLI (set_config_value)
//
//  Clé inconnue dans le fichier → ignorée (log warn). Valeur invalide → InvalidConfig.
// ============================================================================

#pragma once
#include <cstddef>
#include <string>

#include "gallery_error.hpp"
#include "gallery_log.hpp"

namespace EinkGallery
{

struct FrameConfig
{
    std::string defaults_dir   = "./displays";
    std::string overrides_dir  = "./data/displays";
    std::string images_dir     = "./data/images";
    std::string catalog_index;              // vide → <images_dir>/catalog.json
    unsigned    workers        = 0;         // 0 → hardware_concurrency
    size_t      queue_capacity = 16;
    bool        dither         = true;
    LogLevel    log_level      = LogLevel::Info;

    std::string effective_catalog_index() const;
};

bool load_frame_config_file(const std::string& path, FrameConfig& cfg, GalleryError* err = nullptr);
bool parse_frame_config_json(const std::string& text, FrameConfig& cfg, GalleryError* err = nullptr);

// Clés: defaults_dir, overrides_dir, images_dir, catalog_index, workers,
// queue_capacity, dither, log_level.
bool set_config_value(FrameConfig& cfg, const std::string& key, const std::string& value,
                      GalleryError* err = nullptr);

bool apply_env_overrides(FrameConfig& cfg, GalleryError* err = nullptr);

} // namespace EinkGallery
