// ============================================================================
//  File: src/minitest_service.cpp — Mini-tests config, pool, service de rendu
//  Run:
//    ./minitest_service
// ============================================================================

#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <atomic>
#include <chrono>
#include <thread>
#include <stdexcept>
#include <algorithm>
#include <filesystem>

#include <stdlib.h>
#include <unistd.h>

#include "frame_config.hpp"
#include "frame_service.hpp"
#include "gallery_log.hpp"
#include "image_catalog.hpp"
#include "image_decode.hpp"
#include "io_image.hpp"
#include "profile_store.hpp"
#include "render_pool.hpp"

using namespace EinkGallery;
namespace fs = std::filesystem;

// ------------------ ASSERT minimaliste --------------------------------------
#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

// ------------------ TEST A : configuration ----------------------------------
static bool test_config_defaults()
{
    FrameConfig c;
    T_ASSERT( c.defaults_dir=="./displays" );
    T_ASSERT( c.overrides_dir=="./data/displays" );
    T_ASSERT( c.images_dir=="./data/images" );
    T_ASSERT( c.workers==0 && c.queue_capacity==16 && c.dither );
    T_ASSERT( c.log_level==LogLevel::Info );
    T_ASSERT( c.effective_catalog_index()==(fs::path("./data/images")/"catalog.json").string() );
    c.catalog_index = "/tmp/x.json";
    T_ASSERT( c.effective_catalog_index()=="/tmp/x.json" );
    return true;
}

static bool test_config_json()
{
    FrameConfig c;
    GalleryError e;
    const std::string text =
        "{ // réglages\n"
        "  \"images_dir\": \"/srv/photos\", \"workers\": 3, \"queue_capacity\": 4,\n"
        "  \"dither\": false, \"log_level\": \"debug\", \"colour\": \"ignored\" }";
    T_ASSERT( parse_frame_config_json(text, c, &e) );
    T_ASSERT( c.images_dir=="/srv/photos" && c.workers==3 && c.queue_capacity==4 );
    T_ASSERT( !c.dither && c.log_level==LogLevel::Debug );
    T_ASSERT( c.defaults_dir=="./displays" );

    FrameConfig d;
    T_ASSERT( !parse_frame_config_json("{\"workers\": -2}", d, &e) && e.kind==ErrorKind::InvalidConfig );
    T_ASSERT( !parse_frame_config_json("{\"queue_capacity\": 0}", d, &e) && e.kind==ErrorKind::InvalidConfig );
    T_ASSERT( !parse_frame_config_json("{\"log_level\": \"loud\"}", d, &e) && e.kind==ErrorKind::InvalidConfig );
    T_ASSERT( !parse_frame_config_json("{\"workers\": [1]}", d, &e) && e.kind==ErrorKind::InvalidConfig );
    T_ASSERT( !parse_frame_config_json("[]", d, &e) && e.kind==ErrorKind::InvalidConfig );
    T_ASSERT( !parse_frame_config_json("{ oops", d, &e) && e.kind==ErrorKind::InvalidConfig );
    T_ASSERT( !parse_frame_config_json("{\"workers\": 1e400}", d, &e) && e.kind==ErrorKind::InvalidConfig );
    T_ASSERT( !load_frame_config_file("/nonexistent/eink.json", d, &e) && e.kind==ErrorKind::InvalidConfig );
    return true;
}

static bool test_config_overrides()
{
    FrameConfig c;
    GalleryError e;
    T_ASSERT( set_config_value(c, "workers", "8", &e) && c.workers==8 );
    T_ASSERT( !set_config_value(c, "workers", "eight", &e) && e.kind==ErrorKind::InvalidConfig );
    T_ASSERT( c.workers==8 );
    T_ASSERT( !set_config_value(c, "defaults_dir", "", &e) );
    T_ASSERT( !set_config_value(c, "bogus", "1", &e) );
    T_ASSERT( set_config_value(c, "dither", "off", &e) && !c.dither );

    ::setenv("EINK_IMAGES_DIR", "/env/images", 1);
    ::setenv("EINK_WORKERS", "2", 1);
    T_ASSERT( apply_env_overrides(c, &e) );
    T_ASSERT( c.images_dir=="/env/images" && c.workers==2 );

    ::setenv("EINK_WORKERS", "many", 1);
    const bool bad = apply_env_overrides(c, &e);
    ::unsetenv("EINK_IMAGES_DIR");
    ::unsetenv("EINK_WORKERS");
    T_ASSERT( !bad && e.kind==ErrorKind::InvalidConfig );
    T_ASSERT( e.message.find("EINK_WORKERS")!=std::string::npos );
    return true;
}

// ------------------ TEST B : pool de rendu ------------------------------------
static bool test_pool_results()
{
    RenderPool pool(2, 2);
    T_ASSERT( pool.worker_count()==2 && pool.capacity()==2 );
    std::vector<std::future<int>> futs;
    for(int i=0; i<20; ++i)
    {
        futs.push_back(pool.submit([i]()
        {
            return i*i;
        }));
    }
    for(int i=0; i<20; ++i) T_ASSERT( futs[(size_t)i].get()==i*i );
    return true;
}

static bool test_pool_drains_on_shutdown()
{
    std::atomic<int> done{0};
    std::vector<std::future<void>> futs;
    {
        RenderPool pool(1, 8);
        for(int i=0; i<8; ++i)
        {
            futs.push_back(pool.submit([&done]()
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                done.fetch_add(1);
            }));
        }
        pool.shutdown();
        T_ASSERT( done.load()==8 );
        // après arrêt: refus
        auto late = pool.submit([]()
        {
            return 1;
        });
        T_ASSERT( !late.valid() );
    }
    for(auto& f: futs) T_ASSERT( f.valid() );
    return true;
}

static bool test_pool_concurrent_shutdown()
{
    std::atomic<int> done{0};
    RenderPool pool(4, 16);
    for(int i=0; i<16; ++i)
    {
        pool.submit([&done]()
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            done.fetch_add(1);
        });
    }
    std::vector<std::thread> stoppers;
    for(int i=0; i<4; ++i) stoppers.emplace_back([&pool]()
    {
        pool.shutdown();
    });
    for(std::thread& t: stoppers) t.join();
    T_ASSERT( done.load()==16 );
    T_ASSERT( pool.worker_count()==4 );
    pool.shutdown();
    return true;
}

static bool test_pool_exception()
{
    RenderPool pool(1, 1);
    auto f = pool.submit([]() -> int
    {
        throw std::runtime_error("boom");
    });
    bool threw = false;
    try
    {
        f.get();
    }
    catch(const std::runtime_error&)
    {
        threw = true;
    }
    T_ASSERT( threw );
    // le worker survit
    T_ASSERT( pool.submit([]()
    {
        return 7;
    }).get()==7 );
    return true;
}

// ------------------ TEST C : service -----------------------------------------
static std::vector<uint8_t> png_of(int w,int h, uint8_t v)
{
    ImageU8 img;
    make_canvas_rgb(w, h, v,v,v, img);
    std::vector<uint8_t> png;
    encode_png_rgb8(img, png);
    return png;
}

static bool frame_ok(const std::vector<uint8_t>& png, int W, int H)
{
    ImageU8 img;
    if(!decode_image_rgb8(png, img)) return false;
    if(img.w!=W || img.h!=H) return false;
    for(size_t i=0; i<img.data.size(); ++i)
    {
        if(img.data[i]!=0 && img.data[i]!=255) return false;
    }
    return true;
}

struct ServiceFixture
{
    fs::path            root;
    ProfileStore        store;
    MemoryImageCatalog  catalog;
    RenderPool          pool;
    FrameService        svc;

    ServiceFixture()
        : root(fs::temp_directory_path() / ("eink_minitest_service_" + std::to_string(::getpid()))),
          store(make_dirs(root)+"/defaults", root.string()+"/overrides"),
          pool(2, 4),
          svc(store, catalog, pool, true)
    {
        std::ofstream(root/"defaults"/"bw_test.json")
                << "{\"resolution\":{\"width\":32,\"height\":24},"
                "\"color_mapping\":{\"palette\":[[0,0,0],[255,255,255]]}}";
        GalleryError e;
        if(!store.init(&e)) std::cerr << "[SETUP] " << e.message << "\n";
        catalog.add("white.png", {"bright"}, png_of(40, 30, 255));
        catalog.add("black.png", {"dark"},   png_of(30, 40, 0));
        catalog.add("gray.png",  {"dark", "mid"}, png_of(64, 64, 128));
        svc.seed(42);
    }
    ~ServiceFixture()
    {
        pool.shutdown();
        std::error_code ec;
        fs::remove_all(root, ec);
    }
    static std::string make_dirs(const fs::path& r)
    {
        std::error_code ec;
        fs::remove_all(r, ec);
        fs::create_directories(r/"defaults");
        return r.string();
    }
};

static bool test_render_upload(ServiceFixture& fx)
{
    GalleryError e;
    std::vector<uint8_t> png;

    UploadRequest req;
    req.panel  = "bw_test";
    req.source = png_of(100, 50, 255);
    T_ASSERT( fx.svc.render_upload(req, png, &e) );
    T_ASSERT( frame_ok(png, 32, 24) );

    req.crop = false;
    T_ASSERT( fx.svc.render_upload(req, png, &e) );
    T_ASSERT( frame_ok(png, 32, 24) );

    req.panel = "no_such_panel";
    T_ASSERT( !fx.svc.render_upload(req, png, &e) && e.kind==ErrorKind::NotFound );
    T_ASSERT( std::find(e.available.begin(), e.available.end(), "bw_test")!=e.available.end() );

    req.panel  = "bw_test";
    req.source = { 1,2,3,4,5,6,7,8 };
    T_ASSERT( !fx.svc.render_upload(req, png, &e) && e.kind==ErrorKind::DecodeError );

    req.source.clear();
    T_ASSERT( !fx.svc.render_upload(req, png, &e) && e.kind==ErrorKind::InvalidArgument );
    return true;
}

static bool test_render_named(ServiceFixture& fx)
{
    GalleryError e;
    std::vector<uint8_t> png;
    T_ASSERT( fx.svc.render_named("bw_test", "white", true, png, &e) );
    T_ASSERT( frame_ok(png, 32, 24) );
    T_ASSERT( fx.svc.render_named("bw_test", "black.png", false, png, &e) );
    T_ASSERT( frame_ok(png, 32, 24) );
    T_ASSERT( !fx.svc.render_named("bw_test", "river", true, png, &e) && e.kind==ErrorKind::NotFound );
    T_ASSERT( !fx.svc.render_named("ghost", "white", true, png, &e) && e.kind==ErrorKind::NotFound );
    return true;
}

static bool test_render_selection(ServiceFixture& fx)
{
    GalleryError e;
    SelectionRenderRequest req;
    req.panel = "bw_test";
    req.policy = SelectionPolicy::Next;
    req.current_index = 2;
    SelectionRender out;
    T_ASSERT( fx.svc.render_selection(req, out, &e) );
    T_ASSERT( out.filename=="white.png" && out.index && *out.index==0 );
    T_ASSERT( frame_ok(out.png, 32, 24) );

    req.tag_filter = {"DARK"};
    req.current_index = 0;
    T_ASSERT( fx.svc.render_selection(req, out, &e) );
    T_ASSERT( out.filename=="gray.png" && *out.index==1 );

    req.current_index.reset();
    T_ASSERT( !fx.svc.render_selection(req, out, &e) && e.kind==ErrorKind::InvalidArgument );

    req.policy = SelectionPolicy::Random;
    T_ASSERT( fx.svc.render_selection(req, out, &e) );
    T_ASSERT( out.filename=="black.png" || out.filename=="gray.png" );
    T_ASSERT( !out.index.has_value() );

    req.tag_filter = {"sepia"};
    T_ASSERT( !fx.svc.render_selection(req, out, &e) && e.kind==ErrorKind::NotFound );
    return true;
}

static bool test_concurrent_renders(ServiceFixture& fx)
{
    std::atomic<int> okCount{0};
    std::vector<std::thread> th;
    for(int t=0; t<6; ++t)
    {
        th.emplace_back([&fx, &okCount, t]()
        {
            std::vector<uint8_t> png;
            GalleryError e;
            const char* names[] = { "white", "black", "gray" };
            if(fx.svc.render_named("bw_test", names[t%3], true, png, &e) && frame_ok(png, 32, 24)) okCount++;
        });
    }
    for(auto& t: th) t.join();
    T_ASSERT( okCount.load()==6 );
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main()
{
    set_log_level(LogLevel::Warn);
    bool ok = true;

    ok &= test_config_defaults();
    ok &= test_config_json();
    ok &= test_config_overrides();
    std::cout << "[A] config : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_pool_results();
    ok &= test_pool_drains_on_shutdown();
    ok &= test_pool_concurrent_shutdown();
    ok &= test_pool_exception();
    std::cout << "[B] render pool : " << (ok? "OK":"FAIL") << "\n";

    {
        ServiceFixture fx;
        ok &= test_render_upload(fx);
        ok &= test_render_named(fx);
        ok &= test_render_selection(fx);
        ok &= test_concurrent_renders(fx);
    }
    std::cout << "[C] frame service : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
