// ============================================================================
//  File: include/image_catalog.hpp — Collaborateur métadonnées images (DOC+)
//  Project: E-Ink Gallery Renderer v1
//
//  OBJET
//  -----
//  • Interface lue par la sélection et le rendu:
//      list_images()            → séquence ordonnée {filename, tags}
//      read_image_bytes(name)   → octets, NotFound si absent
//  • Les tags arrivent sous plusieurs formes ("winter", {"name":"winter"},
//    {"tag":"winter"}); ils sont normalisés ICI en TagSet minuscule.
//    La sélection ne voit jamais que ce type canonique.
//
//  IMPLÉMENTATIONS
//  ---------------
//  • MemoryImageCatalog    : en mémoire (tests, intégration).
//  • DirectoryImageCatalog : <images_dir>/ + index JSON relu à chaque appel:
//      { "images": [ { "filename": "a.jpg", "tags": ["x", {"name":"y"}],
//                      "title": "...", "artist": "..." } ] }
//    Sans index: fichiers image du répertoire, triés par nom, sans tags.
// ============================================================================

#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "gallery_error.hpp"

namespace EinkGallery
{

using TagSet = std::set<std::string>;

// Trim + minuscules ASCII. Chaîne vide → tag ignoré.
std::string normalize_tag_value(const std::string& raw);

struct ImageRecord
{
    std::string filename;
    TagSet      tags;
    std::string title;
    std::string artist;
};

class ImageCatalog
{
public:
    virtual ~ImageCatalog() = default;

    virtual bool list_images(std::vector<ImageRecord>& out, GalleryError* err = nullptr) const = 0;
    virtual bool read_image_bytes(const std::string& filename,
                                  std::vector<uint8_t>& out,
                                  GalleryError* err = nullptr) const = 0;
};

// Recherche par nom exact, puis par nom sans extension (premier trouvé).
bool find_image_by_basename(const std::vector<ImageRecord>& images,
                            const std::string& name,
                            std::string& filename);

// Analyse d’un index JSON (format ci-dessus), tags normalisés.
bool parse_catalog_index(const std::string& text,
                         std::vector<ImageRecord>& out,
                         GalleryError* err = nullptr);

class MemoryImageCatalog : public ImageCatalog
{
public:
    // Tags bruts, normalisés à l’insertion. Remplace une entrée de même nom.
    void add(const std::string& filename,
             const std::vector<std::string>& raw_tags,
             std::vector<uint8_t> bytes);
    bool erase(const std::string& filename);

    bool list_images(std::vector<ImageRecord>& out, GalleryError* err = nullptr) const override;
    bool read_image_bytes(const std::string& filename,
                          std::vector<uint8_t>& out,
                          GalleryError* err = nullptr) const override;

private:
    mutable std::mutex                              mu_;
    std::vector<ImageRecord>                        order_;
    std::map<std::string, std::vector<uint8_t>>     bytes_;
};

class DirectoryImageCatalog : public ImageCatalog
{
public:
    DirectoryImageCatalog(std::string images_dir, std::string index_path);

    bool list_images(std::vector<ImageRecord>& out, GalleryError* err = nullptr) const override;
    bool read_image_bytes(const std::string& filename,
                          std::vector<uint8_t>& out,
                          GalleryError* err = nullptr) const override;

private:
    std::string images_dir_;
    std::string index_path_;
};

} // namespace EinkGallery
