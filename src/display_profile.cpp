// ============================================================================
//  File: src/display_profile.cpp — Validation des profils de panneau
//  Project: E-Ink Gallery Renderer v1
// ============================================================================

#include "display_profile.hpp"

#include <cctype>
#include <cmath>
#include <sstream>

#include <nlohmann/json.hpp>

namespace EinkGallery
{

using nlohmann::json;

bool is_valid_profile_name(const std::string& name)
{
    if(name.empty()) return false;
    for(char c: name)
    {
        const unsigned char u = (unsigned char)c;
        if(u>=0x80) return false;
        if(!std::isalnum(u) && c!='_' && c!='-') return false;
    }
    return true;
}

namespace
{

bool invalid(GalleryError* err, const std::string& name, const std::string& why)
{
    return fail(err, ErrorKind::InvalidConfig,
                "Invalid config for " + name + kProfileExtension + ": " + why);
}

bool read_side(const json& res, const char* key, int& out)
{
    auto it = res.find(key);
    if(it==res.end() || !it->is_number_integer()) return false;
    const long long v = it->get<long long>();
    if(v<=0 || v>kMaxPanelSide) return false;
    out = (int)v;
    return true;
}

bool read_channel(const json& v, uint8_t& out)
{
    if(!v.is_number_integer()) return false;
    const long long c = v.get<long long>();
    if(c<0 || c>255) return false;
    out = (uint8_t)c;
    return true;
}

} // anon

std::optional<DisplayProfile> DisplayProfile::create(const std::string& name,
                                                     int width, int height,
                                                     const std::vector<Rgb8>& palette,
                                                     double gamma,
                                                     GalleryError* err)
{
    if(!is_valid_profile_name(name))
    {
        fail(err, ErrorKind::InvalidName,
             "Display name must contain only alphanumeric characters, hyphens, and underscores");
        return std::nullopt;
    }
    if(width<=0 || height<=0 || width>kMaxPanelSide || height>kMaxPanelSide)
    {
        invalid(err, name, "missing or invalid resolution");
        return std::nullopt;
    }
    if(palette.empty() || (int)palette.size()>kMaxPaletteColors)
    {
        invalid(err, name, "palette must hold 1 to 256 colors");
        return std::nullopt;
    }
    if(!std::isfinite(gamma) || gamma<=0.0)
    {
        invalid(err, name, "gamma must be a positive number");
        return std::nullopt;
    }
    DisplayProfile p;
    p.name_    = name;
    p.width_   = width;
    p.height_  = height;
    p.palette_ = palette;
    p.gamma_   = gamma;
    return p;
}

std::optional<DisplayProfile> DisplayProfile::parse(const std::string& name,
                                                    const std::string& raw,
                                                    GalleryError* err)
{
    json doc;
    try
    {
        doc = json::parse(raw, nullptr, true, /*ignore_comments*/true);
    }
    catch(const json::exception& e)
    {
        invalid(err, name, std::string("malformed document (") + e.what() + ")");
        return std::nullopt;
    }
    if(!doc.is_object())
    {
        invalid(err, name, "top level must be a mapping");
        return std::nullopt;
    }

    // resolution
    auto res = doc.find("resolution");
    int w=0, h=0;
    if(res==doc.end() || !res->is_object() ||
            !read_side(*res, "width", w) || !read_side(*res, "height", h))
    {
        invalid(err, name, "missing or invalid resolution");
        return std::nullopt;
    }

    // color_mapping.palette
    auto cm = doc.find("color_mapping");
    if(cm==doc.end() || !cm->is_object())
    {
        invalid(err, name, "missing or invalid color_mapping");
        return std::nullopt;
    }
    auto pal = cm->find("palette");
    if(pal==cm->end() || !pal->is_array())
    {
        invalid(err, name, "missing or invalid color_mapping");
        return std::nullopt;
    }
    if(pal->empty() || pal->size()>(size_t)kMaxPaletteColors)
    {
        invalid(err, name, "palette must hold 1 to 256 colors");
        return std::nullopt;
    }
    std::vector<Rgb8> colors;
    colors.reserve(pal->size());
    for(size_t i=0; i<pal->size(); ++i)
    {
        const json& e = (*pal)[i];
        Rgb8 c;
        if(!e.is_array() || e.size()!=3 ||
                !read_channel(e[0], c.r) || !read_channel(e[1], c.g) || !read_channel(e[2], c.b))
        {
            std::ostringstream os;
            os << "invalid color format at palette[" << i << "], expected [R, G, B] in 0..255";
            invalid(err, name, os.str());
            return std::nullopt;
        }
        colors.push_back(c);
    }

    // gamma (optionnel)
    double gamma = 1.0;
    auto g = doc.find("gamma");
    if(g!=doc.end())
    {
        if(!g->is_number())
        {
            invalid(err, name, "gamma must be a positive number");
            return std::nullopt;
        }
        gamma = g->get<double>();
    }

    return create(name, w, h, colors, gamma, err);
}

std::string DisplayProfile::to_json_text() const
{
    json pal = json::array();
    for(const Rgb8& c: palette_) pal.push_back({c.r, c.g, c.b});
    json doc;
    doc["resolution"]    = { {"width", width_}, {"height", height_} };
    doc["color_mapping"] = { {"palette", pal} };
    doc["gamma"]         = gamma_;
    return doc.dump(2);
}

} // namespace EinkGallery
