// ============================================================================
//  File: include/profile_store.hpp — Stockage des profils en deux tiers (DOC+)
//  Project: E-Ink Gallery Renderer v1
//
//  OBJET
//  -----
//  • Tier "default"  : répertoire lecture seule livré avec le système.
//  • Tier "override" : répertoire inscriptible, survit aux mises à jour.
//  • Résolution d’un nom: override si présent, sinon default, sinon NotFound.
//  • Un fichier par profil: <dir>/<name>.json.
//
//  CONCURRENCE
//  -----------
//  • Pas de verrou: deux écrivains sur le même nom → le dernier gagne.
//  • Écriture = fichier temporaire voisin + rename: un lecteur voit l’ancien
//    ou le nouveau contenu, jamais un fichier partiel.
//
//  API
//  ---
//   list()                         → ProfileRecord triés par nom
//   load(name) / load_raw(name)    → profil validé / texte brut
//   save(name, raw)                → override (validation complète)
//   reset(name)                    → supprime l’override (default requis)
//   duplicate(src, new_name)       → copie brute verbatim vers override
//   remove(name)                   → supprime un override
//   export_profile(name)           → {"<name>.json", contenu}
//   import_profile(file, raw, ow)  → comme save, nom tiré du fichier
// ============================================================================

#pragma once
#include <optional>
#include <string>
#include <vector>

#include "display_profile.hpp"
#include "gallery_error.hpp"

namespace EinkGallery
{

struct ProfileRecord
{
    std::string name;
    bool        is_custom = false;
    std::string modified_at; // ISO-8601, vide si !is_custom
};

struct SaveResult
{
    std::string name;
    bool        is_custom = true;
    std::string modified_at;
};

struct ExportedProfile
{
    std::string filename;
    std::string content;
};

class ProfileStore
{
public:
    ProfileStore(std::string default_dir, std::string override_dir);

    // Crée le répertoire override si besoin.
    bool init(GalleryError* err = nullptr);

    const std::string& default_dir()  const { return default_dir_; }
    const std::string& override_dir() const { return override_dir_; }

    std::vector<ProfileRecord> list() const;
    std::vector<std::string>   list_names() const;

    std::optional<DisplayProfile> load(const std::string& name, GalleryError* err = nullptr) const;
    bool load_raw(const std::string& name, std::string& raw, GalleryError* err = nullptr) const;

    bool save(const std::string& name, const std::string& raw,
              SaveResult& out, GalleryError* err = nullptr);
    bool reset(const std::string& name, GalleryError* err = nullptr);
    bool duplicate(const std::string& source, const std::string& new_name,
                   SaveResult& out, GalleryError* err = nullptr);
    bool remove(const std::string& name, GalleryError* err = nullptr);
    bool export_profile(const std::string& name, ExportedProfile& out,
                        GalleryError* err = nullptr) const;
    bool import_profile(const std::string& filename, const std::string& raw, bool overwrite,
                        SaveResult& out, GalleryError* err = nullptr);

    bool has_override(const std::string& name) const;
    bool has_default(const std::string& name) const;

private:
    std::string default_path(const std::string& name) const;
    std::string override_path(const std::string& name) const;
    bool resolve(const std::string& name, std::string& path, GalleryError* err) const;
    bool write_override(const std::string& name, const std::string& raw,
                        SaveResult& out, GalleryError* err);

    std::string default_dir_;
    std::string override_dir_;
};

// Horodatage local ISO-8601 (secondes), ex. "2026-10-19T08:15:02".
std::string iso_timestamp_now();

} // namespace EinkGallery
