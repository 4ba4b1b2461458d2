// ============================================================================
//  File: src/eink_gallery.cpp — CLI profils de panneaux + rendu de cadres
//  Project: E-Ink Gallery Renderer v1
//
//  USAGE EXAMPLES
//  --------------
//   # Profils
//   ./eink_gallery list
//   ./eink_gallery show acep_7color_800x480
//   ./eink_gallery save living_room my_panel.json
//   ./eink_gallery duplicate acep_7color_800x480 living_room
//   ./eink_gallery export living_room --out living_room.json
//   ./eink_gallery import living_room.json --overwrite
//   ./eink_gallery reset acep_7color_800x480
//   ./eink_gallery delete living_room
//
//   # Rendu
//   ./eink_gallery render acep_7color_800x480 photo.jpg --letterbox --out frame.png
//   ./eink_gallery random bw_800x480 --tags winter,snow
//   ./eink_gallery next bw_800x480 --current-index 4
//
//  OPTIONS GLOBALES
//  ----------------
//   --config f.json  --defaults-dir D  --overrides-dir D  --images-dir D
//   --catalog f.json --workers N       --queue N          --log-level L
//
//  CODES DE SORTIE
//  ---------------
//   0 OK, 1 échec d’opération, 2 usage.
// ============================================================================

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "frame_config.hpp"
#include "frame_service.hpp"
#include "gallery_error.hpp"
#include "gallery_log.hpp"
#include "image_catalog.hpp"
#include "image_selector.hpp"
#include "profile_store.hpp"
#include "render_pool.hpp"

using namespace EinkGallery;

struct Args
{
    std::string command;
    std::vector<std::string> positional;
    std::string config_path;
    std::vector<std::pair<std::string,std::string>> overrides; // clé config → valeur
    std::string out_path;
    std::string tags;
    std::string current_index;
    bool crop=true;
    bool no_dither=false;
    bool overwrite=false;
};

static void print_usage(const char* exe)
{
    std::cerr
            << "Usage:\n"
            << "  " << exe << " list\n"
            << "  " << exe << " show <name>\n"
            << "  " << exe << " save <name> <file.json>\n"
            << "  " << exe << " reset <name>\n"
            << "  " << exe << " duplicate <source> <new_name>\n"
            << "  " << exe << " delete <name>\n"
            << "  " << exe << " export <name> [--out file.json]\n"
            << "  " << exe << " import <file.json> [--overwrite]\n"
            << "  " << exe << " render <panel> <image> [--crop|--letterbox] [--no-dither] [--out frame.png]\n"
            << "  " << exe << " random <panel> [--tags a,b] [--letterbox] [--out frame.png]\n"
            << "  " << exe << " next <panel> --current-index N [--tags a,b] [--letterbox] [--out frame.png]\n"
            << "Global options: --config f.json --defaults-dir D --overrides-dir D --images-dir D\n"
            << "                --catalog f.json --workers N --queue N --log-level debug|info|warn|error|off\n";
}

static bool parse_args(int argc,char**argv, Args& a)
{
    if(argc<2)
    {
        print_usage(argv[0]);
        return false;
    }
    a.command=argv[1];
    for(int i=2; i<argc; ++i)
    {
        std::string s=argv[i];
        const bool hasVal = i+1<argc;
        if(s=="--config" && hasVal) a.config_path=argv[++i];
        else if(s=="--defaults-dir" && hasVal)  a.overrides.emplace_back("defaults_dir", argv[++i]);
        else if(s=="--overrides-dir" && hasVal) a.overrides.emplace_back("overrides_dir", argv[++i]);
        else if(s=="--images-dir" && hasVal)    a.overrides.emplace_back("images_dir", argv[++i]);
        else if(s=="--catalog" && hasVal)       a.overrides.emplace_back("catalog_index", argv[++i]);
        else if(s=="--workers" && hasVal)       a.overrides.emplace_back("workers", argv[++i]);
        else if(s=="--queue" && hasVal)         a.overrides.emplace_back("queue_capacity", argv[++i]);
        else if(s=="--log-level" && hasVal)     a.overrides.emplace_back("log_level", argv[++i]);
        else if(s=="--out" && hasVal)           a.out_path=argv[++i];
        else if(s=="--tags" && hasVal)          a.tags=argv[++i];
        else if(s=="--current-index" && hasVal) a.current_index=argv[++i];
        else if(s=="--crop")      a.crop=true;
        else if(s=="--letterbox") a.crop=false;
        else if(s=="--no-dither") a.no_dither=true;
        else if(s=="--overwrite") a.overwrite=true;
        else if(s.size()>2 && s.compare(0,2,"--")==0)
        {
            std::cerr<<"Unknown or incomplete option: "<<s<<"\n";
            print_usage(argv[0]);
            return false;
        }
        else a.positional.push_back(s);
    }
    return true;
}

static bool need_positional(const Args& a, size_t n, const char* exe)
{
    if(a.positional.size()>=n) return true;
    std::cerr<<"'"<<a.command<<"' expects "<<n<<" argument(s)\n";
    print_usage(exe);
    return false;
}

static int report(const GalleryError& e)
{
    std::cerr<<"error ["<<error_kind_name(e.kind)<<"]: "<<e.message<<"\n";
    if(!e.available.empty())
    {
        std::cerr<<"available:";
        for(const std::string& n: e.available) std::cerr<<" "<<n;
        std::cerr<<"\n";
    }
    return 1;
}

static bool read_file(const std::string& path, std::string& out)
{
    std::ifstream f(path, std::ios::binary);
    if(!f) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return !f.bad();
}

static bool write_file(const std::string& path, const void* data, size_t len)
{
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if(!f) return false;
    f.write(static_cast<const char*>(data), (std::streamsize)len);
    return (bool)f;
}

static std::string base_name(const std::string& path)
{
    const size_t p = path.find_last_of("/\\");
    return p==std::string::npos ? path : path.substr(p+1);
}

static bool parse_index(const std::string& s, long long& out)
{
    if(s.empty()) return false;
    errno = 0;
    char* end=nullptr;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if(errno!=0 || end==s.c_str() || *end!='\0') return false;
    out = v;
    return true;
}

static bool build_config(const Args& a, FrameConfig& cfg, GalleryError& e)
{
    if(!a.config_path.empty() && !load_frame_config_file(a.config_path, cfg, &e)) return false;
    if(!apply_env_overrides(cfg, &e)) return false;
    for(const auto& kv: a.overrides)
    {
        if(!set_config_value(cfg, kv.first, kv.second, &e)) return false;
    }
    return true;
}

// ---------------- commandes profils
static int cmd_profiles(const Args& a, ProfileStore& store, const char* exe)
{
    GalleryError e;
    const std::string& c = a.command;

    if(c=="list")
    {
        for(const ProfileRecord& r: store.list())
        {
            std::cout<<r.name<<(r.is_custom? "  [custom "+r.modified_at+"]" : std::string("  [default]"))<<"\n";
        }
        return 0;
    }
    if(c=="show")
    {
        if(!need_positional(a,1,exe)) return 2;
        std::optional<DisplayProfile> p = store.load(a.positional[0], &e);
        if(!p) return report(e);
        std::cout<<p->to_json_text()<<"\n";
        return 0;
    }
    if(c=="save")
    {
        if(!need_positional(a,2,exe)) return 2;
        std::string raw;
        if(!read_file(a.positional[1], raw))
        {
            std::cerr<<"cannot read: "<<a.positional[1]<<"\n";
            return 1;
        }
        SaveResult r;
        if(!store.save(a.positional[0], raw, r, &e)) return report(e);
        std::cout<<"saved "<<r.name<<" ("<<r.modified_at<<")\n";
        return 0;
    }
    if(c=="reset")
    {
        if(!need_positional(a,1,exe)) return 2;
        if(!store.reset(a.positional[0], &e)) return report(e);
        std::cout<<"reset "<<a.positional[0]<<"\n";
        return 0;
    }
    if(c=="duplicate")
    {
        if(!need_positional(a,2,exe)) return 2;
        SaveResult r;
        if(!store.duplicate(a.positional[0], a.positional[1], r, &e)) return report(e);
        std::cout<<"duplicated "<<a.positional[0]<<" -> "<<r.name<<"\n";
        return 0;
    }
    if(c=="delete")
    {
        if(!need_positional(a,1,exe)) return 2;
        if(!store.remove(a.positional[0], &e)) return report(e);
        std::cout<<"deleted "<<a.positional[0]<<"\n";
        return 0;
    }
    if(c=="export")
    {
        if(!need_positional(a,1,exe)) return 2;
        ExportedProfile x;
        if(!store.export_profile(a.positional[0], x, &e)) return report(e);
        const std::string out = a.out_path.empty()? x.filename : a.out_path;
        if(!write_file(out, x.content.data(), x.content.size()))
        {
            std::cerr<<"cannot write: "<<out<<"\n";
            return 1;
        }
        std::cout<<"exported "<<a.positional[0]<<" to "<<out<<"\n";
        return 0;
    }
    if(c=="import")
    {
        if(!need_positional(a,1,exe)) return 2;
        std::string raw;
        if(!read_file(a.positional[0], raw))
        {
            std::cerr<<"cannot read: "<<a.positional[0]<<"\n";
            return 1;
        }
        SaveResult r;
        if(!store.import_profile(base_name(a.positional[0]), raw, a.overwrite, r, &e)) return report(e);
        std::cout<<"imported "<<r.name<<"\n";
        return 0;
    }
    return -1;
}

// ---------------- commandes rendu
static int cmd_render(const Args& a, FrameService& svc, const char* exe)
{
    GalleryError e;
    const std::string out = a.out_path.empty()? std::string("frame.png") : a.out_path;
    std::vector<uint8_t> png;

    if(a.command=="render")
    {
        if(!need_positional(a,2,exe)) return 2;
        const std::string& img = a.positional[1];
        std::string raw;
        if(read_file(img, raw))
        {
            UploadRequest req;
            req.panel  = a.positional[0];
            req.crop   = a.crop;
            req.source.assign(raw.begin(), raw.end());
            if(!svc.render_upload(req, png, &e)) return report(e);
        }
        else
        {
            // pas un fichier local: nom dans la collection
            if(!svc.render_named(a.positional[0], img, a.crop, png, &e)) return report(e);
        }
    }
    else
    {
        if(!need_positional(a,1,exe)) return 2;
        SelectionRenderRequest req;
        req.panel      = a.positional[0];
        req.crop       = a.crop;
        req.tag_filter = parse_tag_filter(a.tags);
        if(a.command=="next")
        {
            req.policy = SelectionPolicy::Next;
            if(!a.current_index.empty())
            {
                long long idx=0;
                if(!parse_index(a.current_index, idx))
                {
                    e.kind = ErrorKind::InvalidArgument;
                    e.message = "current_index must be an integer, got '" + a.current_index + "'";
                    return report(e);
                }
                req.current_index = idx;
            }
        }
        SelectionRender r;
        if(!svc.render_selection(req, r, &e)) return report(e);
        std::cout<<"image: "<<r.filename<<"\n";
        if(r.index) std::cout<<"index: "<<*r.index<<"\n";
        png.swap(r.png);
    }

    if(!write_file(out, png.data(), png.size()))
    {
        std::cerr<<"cannot write: "<<out<<"\n";
        return 1;
    }
    std::cout<<"wrote "<<out<<" ("<<png.size()<<" bytes)\n";
    return 0;
}

int main(int argc,char**argv)
{
    Args a;
    if(!parse_args(argc,argv,a)) return 2;

    FrameConfig cfg;
    GalleryError e;
    if(!build_config(a, cfg, e)) return report(e);
    set_log_level(cfg.log_level);

    ProfileStore store(cfg.defaults_dir, cfg.overrides_dir);
    if(!store.init(&e)) return report(e);

    const int rc = cmd_profiles(a, store, argv[0]);
    if(rc>=0) return rc;

    if(a.command!="render" && a.command!="random" && a.command!="next")
    {
        std::cerr<<"Unknown command: "<<a.command<<"\n";
        print_usage(argv[0]);
        return 2;
    }

    DirectoryImageCatalog catalog(cfg.images_dir, cfg.effective_catalog_index());
    RenderPool pool(cfg.workers, cfg.queue_capacity);
    FrameService svc(store, catalog, pool, cfg.dither && !a.no_dither);
    const int out = cmd_render(a, svc, argv[0]);
    pool.shutdown();
    return out;
}
