// ============================================================================
//  File: src/image_catalog.cpp — Collaborateur métadonnées images
//  Project: E-Ink Gallery Renderer v1
// ============================================================================

#include "image_catalog.hpp"
#include "gallery_log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace EinkGallery
{

using nlohmann::json;

std::string normalize_tag_value(const std::string& raw)
{
    size_t b=0, e=raw.size();
    while(b<e && std::isspace((unsigned char)raw[b])) ++b;
    while(e>b && std::isspace((unsigned char)raw[e-1])) --e;
    std::string out;
    out.reserve(e-b);
    for(size_t i=b; i<e; ++i) out.push_back((char)std::tolower((unsigned char)raw[i]));
    return out;
}

bool find_image_by_basename(const std::vector<ImageRecord>& images,
                            const std::string& name,
                            std::string& filename)
{
    for(const ImageRecord& r: images)
    {
        if(r.filename==name)
        {
            filename = r.filename;
            return true;
        }
    }
    for(const ImageRecord& r: images)
    {
        if(fs::path(r.filename).stem().string()==name)
        {
            filename = r.filename;
            return true;
        }
    }
    return false;
}

namespace
{

// Forme de tag: "x" | {"name":"x"} | {"tag":"x"} ; le reste est ignoré.
void add_tag_from_json(const json& t, TagSet& tags)
{
    std::string v;
    if(t.is_string()) v = t.get<std::string>();
    else if(t.is_object())
    {
        auto n = t.find("name");
        auto g = t.find("tag");
        if(n!=t.end() && n->is_string())      v = n->get<std::string>();
        else if(g!=t.end() && g->is_string()) v = g->get<std::string>();
    }
    v = normalize_tag_value(v);
    if(!v.empty()) tags.insert(v);
}

std::string optional_string(const json& obj, const char* key)
{
    auto it = obj.find(key);
    return (it!=obj.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

bool is_plain_filename(const std::string& f)
{
    if(f.empty() || f=="." || f=="..") return false;
    return f.find('/')==std::string::npos && f.find('\\')==std::string::npos;
}

bool has_image_extension(const fs::path& p)
{
    std::string e = p.extension().string();
    for(char& c: e) c = (char)std::tolower((unsigned char)c);
    static const char* exts[] = { ".jpg",".jpeg",".png",".bmp",".gif",".tga",".tif",".tiff",
                                  ".heic",".heif",".avif",".ppm",".pgm",".psd" };
    for(const char* x: exts) if(e==x) return true;
    return false;
}

bool read_binary_file(const std::string& path, std::vector<uint8_t>& out)
{
    std::ifstream f(path, std::ios::binary);
    if(!f) return false;
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    return !f.bad();
}

} // anon

bool parse_catalog_index(const std::string& text, std::vector<ImageRecord>& out, GalleryError* err)
{
    out.clear();
    json doc;
    try
    {
        doc = json::parse(text, nullptr, true, true);
    }
    catch(const json::exception& e)
    {
        return fail(err, ErrorKind::InvalidConfig, std::string("Malformed image index: ") + e.what());
    }
    const json* arr = nullptr;
    if(doc.is_array()) arr = &doc;
    else if(doc.is_object())
    {
        auto it = doc.find("images");
        if(it!=doc.end() && it->is_array()) arr = &*it;
    }
    if(!arr) return fail(err, ErrorKind::InvalidConfig, "Image index must hold an \"images\" array");

    for(const json& item: *arr)
    {
        if(!item.is_object()) continue;
        ImageRecord r;
        r.filename = optional_string(item, "filename");
        if(r.filename.empty()) continue;
        r.title  = optional_string(item, "title");
        r.artist = optional_string(item, "artist");
        auto tags = item.find("tags");
        if(tags!=item.end())
        {
            if(tags->is_array())
            {
                for(const json& t: *tags) add_tag_from_json(t, r.tags);
            }
            else if(tags->is_string())
            {
                // "a, b" : liste séparée par virgules
                std::stringstream ss(tags->get<std::string>());
                std::string part;
                while(std::getline(ss, part, ','))
                {
                    part = normalize_tag_value(part);
                    if(!part.empty()) r.tags.insert(part);
                }
            }
        }
        out.push_back(std::move(r));
    }
    return true;
}

// ---------------- MemoryImageCatalog
void MemoryImageCatalog::add(const std::string& filename,
                             const std::vector<std::string>& raw_tags,
                             std::vector<uint8_t> bytes)
{
    ImageRecord r;
    r.filename = filename;
    for(const std::string& t: raw_tags)
    {
        const std::string v = normalize_tag_value(t);
        if(!v.empty()) r.tags.insert(v);
    }
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find_if(order_.begin(), order_.end(),
                           [&](const ImageRecord& x)
    {
        return x.filename==filename;
    });
    if(it!=order_.end()) *it = r;
    else order_.push_back(r);
    bytes_[filename] = std::move(bytes);
}

bool MemoryImageCatalog::erase(const std::string& filename)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find_if(order_.begin(), order_.end(),
                           [&](const ImageRecord& x)
    {
        return x.filename==filename;
    });
    if(it==order_.end()) return false;
    order_.erase(it);
    bytes_.erase(filename);
    return true;
}

bool MemoryImageCatalog::list_images(std::vector<ImageRecord>& out, GalleryError*) const
{
    std::lock_guard<std::mutex> lk(mu_);
    out = order_;
    return true;
}

bool MemoryImageCatalog::read_image_bytes(const std::string& filename,
                                          std::vector<uint8_t>& out,
                                          GalleryError* err) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = bytes_.find(filename);
    if(it==bytes_.end()) return fail(err, ErrorKind::NotFound, "Image not found: " + filename);
    out = it->second;
    return true;
}

// ---------------- DirectoryImageCatalog
DirectoryImageCatalog::DirectoryImageCatalog(std::string images_dir, std::string index_path)
    : images_dir_(std::move(images_dir)),
      index_path_(std::move(index_path))
{
}

bool DirectoryImageCatalog::list_images(std::vector<ImageRecord>& out, GalleryError* err) const
{
    out.clear();
    std::error_code ec;
    if(!index_path_.empty() && fs::is_regular_file(index_path_, ec))
    {
        std::ifstream f(index_path_, std::ios::binary);
        if(!f)
        {
            log_error("cannot open image index " + index_path_);
            return fail(err, ErrorKind::IOFailure, "Image index is not readable");
        }
        std::ostringstream ss;
        ss << f.rdbuf();
        return parse_catalog_index(ss.str(), out, err);
    }

    std::vector<std::string> names;
    if(fs::is_directory(images_dir_, ec))
    {
        for(fs::directory_iterator it(images_dir_, ec), end; !ec && it!=end; it.increment(ec))
        {
            std::error_code ec2;
            if(it->is_regular_file(ec2) && has_image_extension(it->path()))
            {
                names.push_back(it->path().filename().string());
            }
        }
        if(ec)
        {
            log_error("image directory scan failed: " + ec.message());
            return fail(err, ErrorKind::IOFailure, "Image storage is not readable");
        }
    }
    std::sort(names.begin(), names.end());
    for(const std::string& n: names)
    {
        ImageRecord r;
        r.filename = n;
        out.push_back(std::move(r));
    }
    return true;
}

bool DirectoryImageCatalog::read_image_bytes(const std::string& filename,
                                             std::vector<uint8_t>& out,
                                             GalleryError* err) const
{
    if(!is_plain_filename(filename)) return fail(err, ErrorKind::NotFound, "Image not found: " + filename);
    const std::string path = (fs::path(images_dir_) / filename).string();
    std::error_code ec;
    if(!fs::is_regular_file(path, ec)) return fail(err, ErrorKind::NotFound, "Image not found: " + filename);
    if(!read_binary_file(path, out))
    {
        log_error("cannot read image file " + path);
        return fail(err, ErrorKind::IOFailure, "Could not read image '" + filename + "'");
    }
    return true;
}

} // namespace EinkGallery
