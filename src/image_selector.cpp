// ============================================================================
//  File: src/image_selector.cpp — Choix de l’image suivante
//  Project: E-Ink Gallery Renderer v1
// ============================================================================

#include "image_selector.hpp"
#include "gallery_log.hpp"

#include <sstream>

namespace EinkGallery
{

namespace
{

std::vector<std::string> normalized_terms(const std::vector<std::string>& raw)
{
    std::vector<std::string> out;
    for(const std::string& t: raw)
    {
        std::string v = normalize_tag_value(t);
        if(!v.empty()) out.push_back(std::move(v));
    }
    return out;
}

std::string join_terms(const std::vector<std::string>& terms)
{
    std::string s;
    for(size_t i=0; i<terms.size(); ++i)
    {
        if(i) s += ", ";
        s += terms[i];
    }
    return s;
}

} // anon

const char* selection_policy_name(SelectionPolicy p)
{
    return p==SelectionPolicy::Next ? "next" : "random";
}

bool parse_selection_policy(const std::string& s, SelectionPolicy& out)
{
    const std::string v = normalize_tag_value(s);
    if(v=="random")
    {
        out = SelectionPolicy::Random;
        return true;
    }
    if(v=="next")
    {
        out = SelectionPolicy::Next;
        return true;
    }
    return false;
}

std::vector<std::string> parse_tag_filter(const std::string& csv)
{
    std::vector<std::string> raw;
    std::stringstream ss(csv);
    std::string part;
    while(std::getline(ss, part, ',')) raw.push_back(part);
    return normalized_terms(raw);
}

std::vector<ImageRecord> filter_by_tags(const std::vector<ImageRecord>& images,
                                        const std::vector<std::string>& tag_filter)
{
    const std::vector<std::string> terms = normalized_terms(tag_filter);
    if(terms.empty()) return images;

    std::vector<ImageRecord> out;
    for(const ImageRecord& r: images)
    {
        for(const std::string& t: terms)
        {
            if(r.tags.count(t))
            {
                out.push_back(r);
                break;
            }
        }
    }
    return out;
}

bool select_from(const std::vector<ImageRecord>& images,
                 const SelectionRequest& req,
                 std::mt19937& rng,
                 SelectionResult& out,
                 GalleryError* err)
{
    if(images.empty()) return fail(err, ErrorKind::NotFound, "No images found");

    const std::vector<std::string> terms = normalized_terms(req.tag_filter);
    const std::vector<ImageRecord> eligible = filter_by_tags(images, terms);
    if(eligible.empty())
    {
        return fail(err, ErrorKind::NotFound, "No images found with tags: " + join_terms(terms));
    }

    const long long n = (long long)eligible.size();
    if(req.policy==SelectionPolicy::Next)
    {
        if(!req.current_index)
        {
            return fail(err, ErrorKind::InvalidArgument, "current_index is required for the next policy");
        }
        const long long cur = *req.current_index;
        // cur+1 déborderait pour LLONG_MAX: on réduit d’abord.
        const long long base = ((cur % n) + n) % n;
        const long long next = (base + 1) % n;
        out.image = eligible[(size_t)next];
        out.index = next;
    }
    else
    {
        std::uniform_int_distribution<size_t> pick(0, eligible.size()-1);
        out.image = eligible[pick(rng)];
        out.index.reset();
    }
    log_debug(std::string("selected ") + out.image.filename + " (" + selection_policy_name(req.policy)
              + ", " + std::to_string(n) + " eligible)");
    return true;
}

bool select_image(const ImageCatalog& catalog,
                  const SelectionRequest& req,
                  std::mt19937& rng,
                  SelectionResult& out,
                  GalleryError* err)
{
    std::vector<ImageRecord> images;
    if(!catalog.list_images(images, err)) return false;
    return select_from(images, req, rng, out, err);
}

} // namespace EinkGallery
