// ============================================================================
//  File: src/profile_store.cpp — Stockage des profils en deux tiers
//  Project: E-Ink Gallery Renderer v1
// ============================================================================

#include "profile_store.hpp"
#include "gallery_log.hpp"

#include <algorithm>
#include <atomic>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>

#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace EinkGallery
{

namespace
{

std::string format_local_time(std::time_t t)
{
    std::tm tmv{};
    localtime_r(&t, &tmv);
    char buf[32];
    if(std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmv)==0) return std::string();
    return buf;
}

std::string mtime_iso(const std::string& path)
{
    struct stat st{};
    if(::stat(path.c_str(), &st)!=0) return std::string();
    return format_local_time(st.st_mtime);
}

bool read_text_file(const std::string& path, std::string& out)
{
    std::ifstream f(path, std::ios::binary);
    if(!f) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    if(f.bad()) return false;
    out = ss.str();
    return true;
}

bool ends_with(const std::string& s, const std::string& suf)
{
    return s.size()>=suf.size() && std::equal(suf.rbegin(), suf.rend(), s.rbegin());
}

// Noms de profils présents dans un répertoire (extension .json, nom valide).
void scan_profile_dir(const std::string& dir, std::vector<std::string>& names)
{
    std::error_code ec;
    if(!fs::is_directory(dir, ec)) return;
    for(fs::directory_iterator it(dir, ec), end; !ec && it!=end; it.increment(ec))
    {
        const fs::path& p = it->path();
        if(p.extension()!=kProfileExtension) continue;
        std::error_code ec2;
        if(!it->is_regular_file(ec2)) continue;
        const std::string stem = p.stem().string();
        if(is_valid_profile_name(stem)) names.push_back(stem);
    }
    if(ec) log_warn("profile directory scan stopped early: " + ec.message());
}

std::atomic<unsigned> g_tmp_seq{0};

bool invalid_name(GalleryError* err)
{
    return fail(err, ErrorKind::InvalidName,
                "Display name must contain only alphanumeric characters, hyphens, and underscores");
}

} // anon

std::string iso_timestamp_now()
{
    return format_local_time(std::time(nullptr));
}

ProfileStore::ProfileStore(std::string default_dir, std::string override_dir)
    : default_dir_(std::move(default_dir)),
      override_dir_(std::move(override_dir))
{
}

bool ProfileStore::init(GalleryError* err)
{
    std::error_code ec;
    fs::create_directories(override_dir_, ec);
    if(ec)
    {
        log_error("cannot create override directory " + override_dir_ + ": " + ec.message());
        return fail(err, ErrorKind::IOFailure, "Profile storage is not writable");
    }
    log_info("ProfileStore initialized");
    log_info("  Default configs: " + default_dir_);
    log_info("  Persistent configs: " + override_dir_);
    return true;
}

std::string ProfileStore::default_path(const std::string& name) const
{
    return (fs::path(default_dir_) / (name + kProfileExtension)).string();
}

std::string ProfileStore::override_path(const std::string& name) const
{
    return (fs::path(override_dir_) / (name + kProfileExtension)).string();
}

bool ProfileStore::has_override(const std::string& name) const
{
    if(!is_valid_profile_name(name)) return false;
    std::error_code ec;
    return fs::is_regular_file(override_path(name), ec);
}

bool ProfileStore::has_default(const std::string& name) const
{
    if(!is_valid_profile_name(name)) return false;
    std::error_code ec;
    return fs::is_regular_file(default_path(name), ec);
}

std::vector<ProfileRecord> ProfileStore::list() const
{
    std::map<std::string, ProfileRecord> byName;

    std::vector<std::string> names;
    scan_profile_dir(default_dir_, names);
    for(const std::string& n: names) byName[n] = ProfileRecord{n, false, std::string()};

    names.clear();
    scan_profile_dir(override_dir_, names);
    for(const std::string& n: names) byName[n] = ProfileRecord{n, true, mtime_iso(override_path(n))};

    std::vector<ProfileRecord> out;
    out.reserve(byName.size());
    for(auto& kv: byName) out.push_back(kv.second);
    return out;
}

std::vector<std::string> ProfileStore::list_names() const
{
    std::vector<std::string> out;
    for(const ProfileRecord& r: list()) out.push_back(r.name);
    return out;
}

bool ProfileStore::resolve(const std::string& name, std::string& path, GalleryError* err) const
{
    if(has_override(name))
    {
        path = override_path(name);
        return true;
    }
    if(has_default(name))
    {
        path = default_path(name);
        return true;
    }
    fail(err, ErrorKind::NotFound, "Display type '" + name + "' not found");
    if(err) err->available = list_names();
    return false;
}

bool ProfileStore::load_raw(const std::string& name, std::string& raw, GalleryError* err) const
{
    std::string path;
    if(!resolve(name, path, err)) return false;
    if(!read_text_file(path, raw))
    {
        log_error("Error loading display config " + name + " from " + path);
        return fail(err, ErrorKind::IOFailure, "Could not read display configuration '" + name + "'");
    }
    return true;
}

std::optional<DisplayProfile> ProfileStore::load(const std::string& name, GalleryError* err) const
{
    std::string raw;
    if(!load_raw(name, raw, err)) return std::nullopt;
    return DisplayProfile::parse(name, raw, err);
}

bool ProfileStore::write_override(const std::string& name, const std::string& raw,
                                  SaveResult& out, GalleryError* err)
{
    std::error_code ec;
    fs::create_directories(override_dir_, ec);

    const std::string final_path = override_path(name);
    std::ostringstream tn;
    tn << "." << name << kProfileExtension << ".tmp." << ::getpid() << "." << g_tmp_seq.fetch_add(1);
    const std::string tmp_path = (fs::path(override_dir_) / tn.str()).string();

    {
        std::ofstream f(tmp_path, std::ios::binary | std::ios::trunc);
        if(f)
        {
            f.write(raw.data(), (std::streamsize)raw.size());
            f.flush();
        }
        if(!f)
        {
            fs::remove(tmp_path, ec);
            log_error("Error saving display config " + name + ": cannot write " + tmp_path);
            return fail(err, ErrorKind::IOFailure, "Could not save display configuration '" + name + "'");
        }
    }
    fs::rename(tmp_path, final_path, ec);
    if(ec)
    {
        log_error("Error saving display config " + name + ": rename to " + final_path + " failed: " + ec.message());
        std::error_code ec2;
        fs::remove(tmp_path, ec2);
        return fail(err, ErrorKind::IOFailure, "Could not save display configuration '" + name + "'");
    }

    out.name        = name;
    out.is_custom   = true;
    out.modified_at = iso_timestamp_now();
    return true;
}

bool ProfileStore::save(const std::string& name, const std::string& raw,
                        SaveResult& out, GalleryError* err)
{
    if(!is_valid_profile_name(name)) return invalid_name(err);
    if(!DisplayProfile::parse(name, raw, err)) return false;
    if(!write_override(name, raw, out, err)) return false;
    log_info("Display config saved: " + name);
    return true;
}

bool ProfileStore::reset(const std::string& name, GalleryError* err)
{
    if(!has_override(name))
    {
        return fail(err, ErrorKind::NotFound, "No custom configuration found for '" + name + "'");
    }
    if(!has_default(name))
    {
        return fail(err, ErrorKind::NotFound, "Default configuration not found for '" + name + "'");
    }
    std::error_code ec;
    if(!fs::remove(override_path(name), ec) || ec)
    {
        log_error("Error resetting display config " + name + ": " + ec.message());
        return fail(err, ErrorKind::IOFailure, "Could not reset display configuration '" + name + "'");
    }
    log_info("Display config reset to default: " + name);
    return true;
}

bool ProfileStore::duplicate(const std::string& source, const std::string& new_name,
                             SaveResult& out, GalleryError* err)
{
    if(!is_valid_profile_name(new_name)) return invalid_name(err);

    std::string raw;
    if(!load_raw(source, raw, err)) return false;
    if(has_override(new_name))
    {
        return fail(err, ErrorKind::AlreadyExists, "Display configuration '" + new_name + "' already exists");
    }
    if(!write_override(new_name, raw, out, err)) return false;
    log_info("Display config duplicated: " + source + " -> " + new_name);
    return true;
}

bool ProfileStore::remove(const std::string& name, GalleryError* err)
{
    if(!has_override(name))
    {
        return fail(err, ErrorKind::NotFound, "Custom configuration not found for '" + name + "'");
    }
    std::error_code ec;
    if(!fs::remove(override_path(name), ec) || ec)
    {
        log_error("Error deleting display config " + name + ": " + ec.message());
        return fail(err, ErrorKind::IOFailure, "Could not delete display configuration '" + name + "'");
    }
    log_info("Display config deleted: " + name);
    return true;
}

bool ProfileStore::export_profile(const std::string& name, ExportedProfile& out, GalleryError* err) const
{
    if(!load_raw(name, out.content, err)) return false;
    out.filename = name + kProfileExtension;
    return true;
}

bool ProfileStore::import_profile(const std::string& filename, const std::string& raw, bool overwrite,
                                  SaveResult& out, GalleryError* err)
{
    const std::string ext = kProfileExtension;
    if(!ends_with(filename, ext))
    {
        return fail(err, ErrorKind::InvalidName, "Filename must end with " + ext);
    }
    const std::string name = filename.substr(0, filename.size()-ext.size());
    if(!is_valid_profile_name(name)) return invalid_name(err);

    if(has_override(name) && !overwrite)
    {
        return fail(err, ErrorKind::AlreadyExists, "Configuration '" + name + "' already exists");
    }
    if(!DisplayProfile::parse(name, raw, err)) return false;
    if(!write_override(name, raw, out, err)) return false;
    log_info("Display config imported: " + name);
    return true;
}

} // namespace EinkGallery
