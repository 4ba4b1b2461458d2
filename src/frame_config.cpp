// ============================================================================
//  File: src/frame_config.cpp — Configuration du service
//  Project: E-Ink Gallery Renderer v1
// ============================================================================

#include "frame_config.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace EinkGallery
{

using nlohmann::json;

namespace
{

constexpr unsigned kMaxWorkers        = 256;
constexpr size_t   kMaxQueueCapacity  = 4096;

bool invalid(GalleryError* err, const std::string& key, const std::string& why)
{
    return fail(err, ErrorKind::InvalidConfig, "Invalid configuration value for '" + key + "': " + why);
}

bool parse_uint(const std::string& s, unsigned long& out)
{
    if(s.empty() || s[0]=='-' || s[0]=='+') return false;
    errno = 0;
    char* end = nullptr;
    const unsigned long v = std::strtoul(s.c_str(), &end, 10);
    if(errno!=0 || end==s.c_str() || *end!='\0') return false;
    out = v;
    return true;
}

bool parse_bool(const std::string& s, bool& out)
{
    if(s=="1" || s=="true"  || s=="yes" || s=="on")
    {
        out=true;
        return true;
    }
    if(s=="0" || s=="false" || s=="no"  || s=="off")
    {
        out=false;
        return true;
    }
    return false;
}

// Valeur JSON → texte pour set_config_value (un seul chemin de validation).
bool json_scalar_text(const json& v, std::string& out)
{
    if(v.is_string())
    {
        out = v.get<std::string>();
        return true;
    }
    if(v.is_boolean())
    {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if(v.is_number_unsigned())
    {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if(v.is_number_integer())
    {
        out = std::to_string(v.get<long long>());
        return true;
    }
    return false;
}

} // anon

std::string FrameConfig::effective_catalog_index() const
{
    if(!catalog_index.empty()) return catalog_index;
    return (std::filesystem::path(images_dir) / "catalog.json").string();
}

bool set_config_value(FrameConfig& cfg, const std::string& key, const std::string& value,
                      GalleryError* err)
{
    if(key=="defaults_dir" || key=="overrides_dir" || key=="images_dir")
    {
        if(value.empty()) return invalid(err, key, "directory must not be empty");
        if(key=="defaults_dir")       cfg.defaults_dir  = value;
        else if(key=="overrides_dir") cfg.overrides_dir = value;
        else                          cfg.images_dir    = value;
        return true;
    }
    if(key=="catalog_index")
    {
        cfg.catalog_index = value;
        return true;
    }
    if(key=="workers")
    {
        unsigned long v=0;
        if(!parse_uint(value, v) || v>kMaxWorkers)
        {
            return invalid(err, key, "expected 0.." + std::to_string(kMaxWorkers) + ", got '" + value + "'");
        }
        cfg.workers = (unsigned)v;
        return true;
    }
    if(key=="queue_capacity")
    {
        unsigned long v=0;
        if(!parse_uint(value, v) || v==0 || v>kMaxQueueCapacity)
        {
            return invalid(err, key, "expected 1.." + std::to_string(kMaxQueueCapacity) + ", got '" + value + "'");
        }
        cfg.queue_capacity = (size_t)v;
        return true;
    }
    if(key=="dither")
    {
        if(!parse_bool(value, cfg.dither)) return invalid(err, key, "expected a boolean, got '" + value + "'");
        return true;
    }
    if(key=="log_level")
    {
        if(!parse_log_level(value, cfg.log_level))
        {
            return invalid(err, key, "expected debug|info|warn|error|off, got '" + value + "'");
        }
        return true;
    }
    return fail(err, ErrorKind::InvalidConfig, "Unknown configuration key '" + key + "'");
}

bool parse_frame_config_json(const std::string& text, FrameConfig& cfg, GalleryError* err)
{
    json doc;
    try
    {
        doc = json::parse(text, nullptr, true, true);
    }
    catch(const json::exception& e)
    {
        return fail(err, ErrorKind::InvalidConfig, std::string("Malformed configuration: ") + e.what());
    }
    if(!doc.is_object()) return fail(err, ErrorKind::InvalidConfig, "Configuration must be a JSON object");

    for(auto it=doc.begin(); it!=doc.end(); ++it)
    {
        static const char* known[] = { "defaults_dir","overrides_dir","images_dir","catalog_index",
                                       "workers","queue_capacity","dither","log_level" };
        bool isKnown=false;
        for(const char* k: known) if(it.key()==k) isKnown=true;
        if(!isKnown)
        {
            log_warn("ignoring unknown configuration key '" + it.key() + "'");
            continue;
        }
        std::string v;
        if(!json_scalar_text(it.value(), v)) return invalid(err, it.key(), "unsupported JSON type");
        if(!set_config_value(cfg, it.key(), v, err)) return false;
    }
    return true;
}

bool load_frame_config_file(const std::string& path, FrameConfig& cfg, GalleryError* err)
{
    std::ifstream f(path, std::ios::binary);
    if(!f)
    {
        return fail(err, ErrorKind::InvalidConfig, "Configuration file not readable: " + path);
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return parse_frame_config_json(ss.str(), cfg, err);
}

bool apply_env_overrides(FrameConfig& cfg, GalleryError* err)
{
    static const struct
    {
        const char* env;
        const char* key;
    } vars[] =
    {
        { "EINK_DEFAULTS_DIR",  "defaults_dir"  },
        { "EINK_OVERRIDES_DIR", "overrides_dir" },
        { "EINK_IMAGES_DIR",    "images_dir"    },
        { "EINK_WORKERS",       "workers"       },
        { "EINK_LOG_LEVEL",     "log_level"     },
    };
    for(const auto& v: vars)
    {
        const char* s = std::getenv(v.env);
        if(!s || !*s) continue;
        if(!set_config_value(cfg, v.key, s, err))
        {
            if(err) err->message = std::string(v.env) + ": " + err->message;
            return false;
        }
    }
    return true;
}

} // namespace EinkGallery
