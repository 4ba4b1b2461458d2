// ============================================================================
//  File: src/minitest_selector.cpp — Mini-tests catalogue + sélection
//  Run:
//    ./minitest_selector
// ============================================================================

#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <map>
#include <set>
#include <random>
#include <filesystem>

#include <unistd.h>

#include "gallery_log.hpp"
#include "image_catalog.hpp"
#include "image_selector.hpp"

using namespace EinkGallery;
namespace fs = std::filesystem;

// ------------------ ASSERT minimaliste --------------------------------------
#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static ImageRecord rec(const std::string& f, std::initializer_list<const char*> tags)
{
    ImageRecord r;
    r.filename = f;
    for(const char* t: tags) r.tags.insert(normalize_tag_value(t));
    return r;
}

static std::vector<ImageRecord> three()
{
    return { rec("a.jpg", {"winter"}), rec("b.jpg", {"summer","beach"}), rec("c.png", {"Winter ", "night"}) };
}

// ------------------ TEST A : normalisation / filtre -------------------------
static bool test_normalize()
{
    T_ASSERT( normalize_tag_value("  WiNtEr\t")=="winter" );
    T_ASSERT( normalize_tag_value("   ").empty() );
    const std::vector<std::string> f = parse_tag_filter("a, B ,,c, ");
    T_ASSERT( f.size()==3 && f[0]=="a" && f[1]=="b" && f[2]=="c" );
    T_ASSERT( parse_tag_filter("").empty() );

    SelectionPolicy p = SelectionPolicy::Random;
    T_ASSERT( parse_selection_policy("Next", p) && p==SelectionPolicy::Next );
    T_ASSERT( parse_selection_policy("random", p) && p==SelectionPolicy::Random );
    T_ASSERT( !parse_selection_policy("shuffle", p) );
    return true;
}

static bool test_filter_or()
{
    const auto imgs = three();
    auto f = filter_by_tags(imgs, {"SUMMER", " winter "});
    T_ASSERT( f.size()==3 );
    f = filter_by_tags(imgs, {"beach"});
    T_ASSERT( f.size()==1 && f[0].filename=="b.jpg" );
    f = filter_by_tags(imgs, {"winter"});
    T_ASSERT( f.size()==2 && f[0].filename=="a.jpg" && f[1].filename=="c.png" );
    // termes vides: pas de filtre
    f = filter_by_tags(imgs, {"", "  "});
    T_ASSERT( f.size()==3 );
    f = filter_by_tags(imgs, {"autumn"});
    T_ASSERT( f.empty() );
    return true;
}

// ------------------ TEST B : politiques --------------------------------------
static bool test_next_wraparound()
{
    const auto imgs = three();
    std::mt19937 rng(7);
    SelectionRequest req;
    req.policy = SelectionPolicy::Next;
    SelectionResult r;
    GalleryError e;

    req.current_index = 2;
    T_ASSERT( select_from(imgs, req, rng, r, &e) );
    T_ASSERT( r.index && *r.index==0 && r.image.filename=="a.jpg" );

    req.current_index = 0;
    T_ASSERT( select_from(imgs, req, rng, r, &e) );
    T_ASSERT( *r.index==1 && r.image.filename=="b.jpg" );

    req.current_index = -1;
    T_ASSERT( select_from(imgs, req, rng, r, &e) );
    T_ASSERT( *r.index==0 );

    req.current_index = 5;
    T_ASSERT( select_from(imgs, req, rng, r, &e) );
    T_ASSERT( *r.index==0 );

    // l’index se relit contre l’ensemble filtré
    req.tag_filter = {"winter"};
    req.current_index = 0;
    T_ASSERT( select_from(imgs, req, rng, r, &e) );
    T_ASSERT( *r.index==1 && r.image.filename=="c.png" );
    req.current_index = 1;
    T_ASSERT( select_from(imgs, req, rng, r, &e) );
    T_ASSERT( *r.index==0 && r.image.filename=="a.jpg" );
    return true;
}

static bool test_next_requires_index()
{
    std::mt19937 rng(1);
    SelectionRequest req;
    req.policy = SelectionPolicy::Next;
    SelectionResult r;
    GalleryError e;
    T_ASSERT( !select_from(three(), req, rng, r, &e) );
    T_ASSERT( e.kind==ErrorKind::InvalidArgument );
    return true;
}

static bool test_not_found_cases()
{
    std::mt19937 rng(1);
    SelectionRequest req;
    SelectionResult r;
    GalleryError e;

    T_ASSERT( !select_from(std::vector<ImageRecord>(), req, rng, r, &e) && e.kind==ErrorKind::NotFound );

    req.tag_filter = {"autumn"};
    T_ASSERT( !select_from(three(), req, rng, r, &e) && e.kind==ErrorKind::NotFound );
    T_ASSERT( e.message.find("autumn")!=std::string::npos );

    req.policy = SelectionPolicy::Next;
    req.current_index = 0;
    T_ASSERT( !select_from(three(), req, rng, r, &e) && e.kind==ErrorKind::NotFound );
    return true;
}

static bool test_random_uniform()
{
    const auto imgs = three();
    std::mt19937 rng(12345);
    SelectionRequest req;
    req.policy = SelectionPolicy::Random;
    SelectionResult r;
    GalleryError e;

    std::map<std::string,int> hits;
    for(int i=0; i<600; ++i)
    {
        T_ASSERT( select_from(imgs, req, rng, r, &e) );
        T_ASSERT( !r.index.has_value() );
        hits[r.image.filename]++;
    }
    T_ASSERT( hits.size()==3 );
    for(const auto& kv: hits) T_ASSERT( kv.second>120 && kv.second<280 );

    // restreint au sous-ensemble filtré
    req.tag_filter = {"night", "beach"};
    for(int i=0; i<50; ++i)
    {
        T_ASSERT( select_from(imgs, req, rng, r, &e) );
        T_ASSERT( r.image.filename=="b.jpg" || r.image.filename=="c.png" );
    }

    // même graine → même suite
    std::mt19937 g1(99), g2(99);
    SelectionResult r1, r2;
    req.tag_filter.clear();
    for(int i=0; i<10; ++i)
    {
        T_ASSERT( select_from(imgs, req, g1, r1, &e) );
        T_ASSERT( select_from(imgs, req, g2, r2, &e) );
        T_ASSERT( r1.image.filename==r2.image.filename );
    }
    return true;
}

// ------------------ TEST C : catalogues --------------------------------------
static bool test_parse_index()
{
    const std::string text =
        "// index de test\n"
        "{ \"images\": [\n"
        "  { \"filename\": \"a.jpg\", \"tags\": [\"Winter\", {\"name\": \" Snow \"}, {\"tag\": \"night\"}, 42, {}],\n"
        "    \"title\": \"Hiver\", \"artist\": \"X\" },\n"
        "  { \"filename\": \"b.jpg\", \"tags\": \"beach, SUN\" },\n"
        "  { \"title\": \"sans fichier\" },\n"
        "  { \"filename\": \"c.jpg\" }\n"
        "] }\n";
    std::vector<ImageRecord> out;
    GalleryError e;
    T_ASSERT( parse_catalog_index(text, out, &e) );
    T_ASSERT( out.size()==3 );
    T_ASSERT( out[0].filename=="a.jpg" && out[0].title=="Hiver" && out[0].artist=="X" );
    T_ASSERT( (out[0].tags==TagSet{"night","snow","winter"}) );
    T_ASSERT( (out[1].tags==TagSet{"beach","sun"}) );
    T_ASSERT( out[2].tags.empty() );

    T_ASSERT( !parse_catalog_index("{ not json", out, &e) && e.kind==ErrorKind::InvalidConfig );
    T_ASSERT( !parse_catalog_index("{\"images\": 3}", out, &e) && e.kind==ErrorKind::InvalidConfig );
    T_ASSERT( !parse_catalog_index("{\"images\":[{\"filename\":\"a.jpg\",\"rating\":1e999}]}", out, &e) );
    T_ASSERT( e.kind==ErrorKind::InvalidConfig );
    return true;
}

static bool test_basename_lookup()
{
    const std::vector<ImageRecord> imgs = { rec("sunset.jpg", {}), rec("sunset", {}), rec("lake.png", {}) };
    std::string f;
    T_ASSERT( find_image_by_basename(imgs, "lake", f) && f=="lake.png" );
    T_ASSERT( find_image_by_basename(imgs, "lake.png", f) && f=="lake.png" );
    // nom exact prioritaire
    T_ASSERT( find_image_by_basename(imgs, "sunset", f) && f=="sunset" );
    T_ASSERT( !find_image_by_basename(imgs, "river", f) );
    return true;
}

static bool test_memory_catalog()
{
    MemoryImageCatalog cat;
    cat.add("a.jpg", {" Winter "}, {1,2,3});
    cat.add("b.jpg", {"beach", ""}, {4});
    cat.add("a.jpg", {"night"}, {9,9});  // remplace, ordre conservé

    std::vector<ImageRecord> l;
    T_ASSERT( cat.list_images(l) );
    T_ASSERT( l.size()==2 && l[0].filename=="a.jpg" && l[1].filename=="b.jpg" );
    T_ASSERT( (l[0].tags==TagSet{"night"}) );
    T_ASSERT( (l[1].tags==TagSet{"beach"}) );

    std::vector<uint8_t> bytes;
    GalleryError e;
    T_ASSERT( cat.read_image_bytes("a.jpg", bytes, &e) && bytes.size()==2 );
    T_ASSERT( !cat.read_image_bytes("zzz.jpg", bytes, &e) && e.kind==ErrorKind::NotFound );

    T_ASSERT( cat.erase("a.jpg") );
    T_ASSERT( !cat.erase("a.jpg") );
    T_ASSERT( cat.list_images(l) && l.size()==1 );

    // sélection à travers l’interface
    std::mt19937 rng(3);
    SelectionRequest req;
    req.policy = SelectionPolicy::Next;
    req.current_index = 0;
    SelectionResult r;
    T_ASSERT( select_image(cat, req, rng, r, &e) && r.image.filename=="b.jpg" && *r.index==0 );
    return true;
}

static bool test_directory_catalog()
{
    const fs::path root = fs::temp_directory_path() / ("eink_minitest_selector_" + std::to_string(::getpid()));
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root / "images");
    auto touch = [&](const std::string& n, const std::string& body)
    {
        std::ofstream f(root / "images" / n, std::ios::binary);
        f << body;
    };
    touch("b.png", "PNGDATA");
    touch("a.JPG", "JPGDATA");
    touch("notes.txt", "x");
    std::ofstream(root / "secret.png") << "outside";

    bool ok = true;
    {
        // sans index: fichiers image triés, sans tags
        DirectoryImageCatalog cat((root/"images").string(), (root/"images"/"catalog.json").string());
        std::vector<ImageRecord> l;
        GalleryError e;
        ok = ok && cat.list_images(l, &e);
        ok = ok && l.size()==2 && l[0].filename=="a.JPG" && l[1].filename=="b.png" && l[0].tags.empty();

        std::vector<uint8_t> bytes;
        ok = ok && cat.read_image_bytes("b.png", bytes, &e) && std::string(bytes.begin(), bytes.end())=="PNGDATA";
        ok = ok && !cat.read_image_bytes("../secret.png", bytes, &e) && e.kind==ErrorKind::NotFound;
        ok = ok && !cat.read_image_bytes("missing.png", bytes, &e) && e.kind==ErrorKind::NotFound;

        // avec index: ordre et tags de l’index, relu à chaque appel
        std::ofstream(root/"images"/"catalog.json")
                << "{\"images\":[{\"filename\":\"b.png\",\"tags\":[{\"name\":\"Sea\"}]},{\"filename\":\"a.JPG\"}]}";
        ok = ok && cat.list_images(l, &e);
        ok = ok && l.size()==2 && l[0].filename=="b.png" && l[0].tags.count("sea")==1;

        std::ofstream(root/"images"/"catalog.json") << "{ broken";
        ok = ok && !cat.list_images(l, &e) && e.kind==ErrorKind::InvalidConfig;
    }
    {
        // répertoire absent: collection vide
        DirectoryImageCatalog cat((root/"nope").string(), std::string());
        std::vector<ImageRecord> l;
        ok = ok && cat.list_images(l) && l.empty();
    }
    fs::remove_all(root, ec);
    T_ASSERT( ok );
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main()
{
    set_log_level(LogLevel::Warn);
    bool ok = true;

    ok &= test_normalize();
    ok &= test_filter_or();
    std::cout << "[A] tag filter : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_next_wraparound();
    ok &= test_next_requires_index();
    ok &= test_not_found_cases();
    ok &= test_random_uniform();
    std::cout << "[B] policies : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_parse_index();
    ok &= test_basename_lookup();
    ok &= test_memory_catalog();
    ok &= test_directory_catalog();
    std::cout << "[C] catalogs : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
