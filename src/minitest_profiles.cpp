// ============================================================================
//  File: src/minitest_profiles.cpp — Mini-tests profils, stockage, palette
//  Run:
//    ./minitest_profiles
//
//  Travaille dans un répertoire temporaire (supprimé à la fin).
// ============================================================================

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <algorithm>
#include <filesystem>

#include <unistd.h>

#include "display_profile.hpp"
#include "palette_table.hpp"
#include "profile_store.hpp"
#include "gallery_log.hpp"

using namespace EinkGallery;
namespace fs = std::filesystem;

// ------------------ ASSERT minimaliste --------------------------------------
#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static const char* kPanelA =
    "// panneau de test\n"
    "{\n"
    "  \"resolution\": { \"width\": 64, \"height\": 48 },\n"
    "  \"color_mapping\": { \"palette\": [[0,0,0],[255,255,255],[255,0,0]] },\n"
    "  \"gamma\": 1.0\n"
    "}\n";

static const char* kPanelCustom =
    "{ \"resolution\": { \"width\": 32, \"height\": 32 },"
    "  \"color_mapping\": { \"palette\": [[0,0,0],[255,255,255]] } }";

// Répertoire de travail: <tmp>/eink_minitest_profiles_<pid>/{defaults,overrides}
struct Sandbox
{
    fs::path root;
    fs::path defaults;
    fs::path overrides;

    Sandbox()
    {
        root = fs::temp_directory_path() / ("eink_minitest_profiles_" + std::to_string(::getpid()));
        std::error_code ec;
        fs::remove_all(root, ec);
        defaults  = root / "defaults";
        overrides = root / "overrides";
        fs::create_directories(defaults);
        write(defaults / "panel_a.json", kPanelA);
    }
    ~Sandbox()
    {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
    static void write(const fs::path& p, const std::string& text)
    {
        std::ofstream f(p, std::ios::binary | std::ios::trunc);
        f << text;
    }
    void reset_overrides()
    {
        std::error_code ec;
        fs::remove_all(overrides, ec);
    }
};

static bool has_kind(const GalleryError& e, ErrorKind k)
{
    if(e.kind!=k) std::cerr<<"  got "<<error_kind_name(e.kind)<<": "<<e.message<<"\n";
    return e.kind==k;
}

// ------------------ TEST A : validation du format -------------------------
static bool test_parse_valid()
{
    GalleryError e;
    auto p = DisplayProfile::parse("panel_a", kPanelA, &e);
    T_ASSERT( p.has_value() );
    T_ASSERT( p->width()==64 && p->height()==48 );
    T_ASSERT( p->palette().size()==3 );
    T_ASSERT( p->palette()[2]==(Rgb8{255,0,0}) );
    T_ASSERT( p->gamma()==1.0 );

    // gamma absent → 1.0
    auto q = DisplayProfile::parse("c", kPanelCustom, &e);
    T_ASSERT( q.has_value() && q->gamma()==1.0 );

    // forme canonique relue à l’identique
    auto r = DisplayProfile::parse("panel_a", p->to_json_text(), &e);
    T_ASSERT( r.has_value() );
    T_ASSERT( r->width()==p->width() && r->height()==p->height() );
    T_ASSERT( r->palette()==p->palette() );
    return true;
}

static bool expect_invalid(const std::string& raw)
{
    GalleryError e;
    auto p = DisplayProfile::parse("bad", raw, &e);
    T_ASSERT( !p.has_value() );
    T_ASSERT( has_kind(e, ErrorKind::InvalidConfig) );
    T_ASSERT( e.message.find("bad.json")!=std::string::npos );
    return true;
}

static bool test_parse_invalid()
{
    const std::string pal2 = "\"color_mapping\":{\"palette\":[[0,0,0],[255,255,255]]}";
    T_ASSERT( expect_invalid("not json at all {") );
    T_ASSERT( expect_invalid("[1,2,3]") );
    T_ASSERT( expect_invalid("{" + pal2 + "}") );                                            // pas de résolution
    T_ASSERT( expect_invalid("{\"resolution\":{\"width\":0,\"height\":10}," + pal2 + "}") );
    T_ASSERT( expect_invalid("{\"resolution\":{\"width\":10.5,\"height\":10}," + pal2 + "}") );
    T_ASSERT( expect_invalid("{\"resolution\":{\"width\":10,\"height\":10}}") );             // pas de palette
    T_ASSERT( expect_invalid("{\"resolution\":{\"width\":10,\"height\":10},\"color_mapping\":{\"palette\":[]}}") );
    T_ASSERT( expect_invalid("{\"resolution\":{\"width\":10,\"height\":10},\"color_mapping\":{\"palette\":[[0,0,256]]}}") );
    T_ASSERT( expect_invalid("{\"resolution\":{\"width\":10,\"height\":10},\"color_mapping\":{\"palette\":[[0,0]]}}") );
    T_ASSERT( expect_invalid("{\"resolution\":{\"width\":10,\"height\":10}," + pal2 + ",\"gamma\":0}") );
    T_ASSERT( expect_invalid("{\"resolution\":{\"width\":10,\"height\":10}," + pal2 + ",\"gamma\":-1.5}") );
    T_ASSERT( expect_invalid("{\"resolution\":{\"width\":10,\"height\":10}," + pal2 + ",\"gamma\":\"1\"}") );
    // débordement numérique au parsing
    T_ASSERT( expect_invalid("{\"resolution\":{\"width\":10,\"height\":10}," + pal2 + ",\"gamma\":1e400}") );
    T_ASSERT( expect_invalid("{\"resolution\":{\"width\":1e999,\"height\":10}," + pal2 + "}") );
    T_ASSERT( expect_invalid("{\"resolution\":{\"width\":99999999999999999999,\"height\":10}," + pal2 + "}") );

    // 257 couleurs
    std::ostringstream big;
    big << "{\"resolution\":{\"width\":10,\"height\":10},\"color_mapping\":{\"palette\":[";
    for(int i=0; i<257; ++i) big << (i? ",":"") << "[" << (i%256) << ",0,0]";
    big << "]}}";
    T_ASSERT( expect_invalid(big.str()) );
    return true;
}

static bool test_names()
{
    T_ASSERT( is_valid_profile_name("panel_a") );
    T_ASSERT( is_valid_profile_name("Living-Room_2") );
    T_ASSERT( !is_valid_profile_name("") );
    T_ASSERT( !is_valid_profile_name("a b") );
    T_ASSERT( !is_valid_profile_name("../etc") );
    T_ASSERT( !is_valid_profile_name("x.json") );
    T_ASSERT( !is_valid_profile_name("caf\xc3\xa9") );

    GalleryError e;
    auto p = DisplayProfile::create("a b", 10, 10, {Rgb8{0,0,0}}, 1.0, &e);
    T_ASSERT( !p.has_value() && has_kind(e, ErrorKind::InvalidName) );
    return true;
}

// ------------------ TEST B : table de palette ------------------------------
static bool test_palette_table()
{
    PaletteTable t = build_palette_table({Rgb8{0,0,0}, Rgb8{20,0,0}, Rgb8{255,255,255}});
    T_ASSERT( t.count==3 );
    T_ASSERT( t.slots.size()==256 );
    T_ASSERT( t.slots[1]==(Rgb8{20,0,0}) );
    T_ASSERT( nearest_palette_index(t, 2,1,0)==0 );
    T_ASSERT( nearest_palette_index(t, 250,240,255)==2 );
    // égalité de distance → plus petit index
    T_ASSERT( nearest_palette_index(t, 10,0,0)==0 );
    // entrées hors bornes (erreur de diffusion)
    T_ASSERT( nearest_palette_index(t, -40,-3,-9)==0 );
    T_ASSERT( nearest_palette_index(t, 300,300,300)==2 );

    // couleurs dupliquées: le premier slot gagne
    PaletteTable d = build_palette_table({Rgb8{9,9,9}, Rgb8{9,9,9}});
    T_ASSERT( nearest_palette_index(d, 9,9,9)==0 );

    PaletteTable empty = build_palette_table(std::vector<Rgb8>());
    T_ASSERT( empty.count==0 && nearest_palette_index(empty, 0,0,0)==-1 );
    return true;
}

// ------------------ TEST C : stockage deux tiers ---------------------------
static bool test_list_and_load(Sandbox& sb)
{
    sb.reset_overrides();
    ProfileStore store(sb.defaults.string(), sb.overrides.string());
    GalleryError e;
    T_ASSERT( store.init(&e) );
    T_ASSERT( fs::is_directory(sb.overrides) );

    auto l = store.list();
    T_ASSERT( l.size()==1 && l[0].name=="panel_a" && !l[0].is_custom && l[0].modified_at.empty() );

    SaveResult r;
    T_ASSERT( store.save("zeta", kPanelCustom, r, &e) );
    T_ASSERT( store.save("alpha", kPanelCustom, r, &e) );
    T_ASSERT( r.name=="alpha" && r.is_custom && !r.modified_at.empty() );

    l = store.list();
    T_ASSERT( l.size()==3 );
    T_ASSERT( l[0].name=="alpha" && l[1].name=="panel_a" && l[2].name=="zeta" );
    T_ASSERT( l[0].is_custom && !l[0].modified_at.empty() );

    auto missing = store.load("nope", &e);
    T_ASSERT( !missing.has_value() && has_kind(e, ErrorKind::NotFound) );
    T_ASSERT( std::find(e.available.begin(), e.available.end(), "panel_a")!=e.available.end() );
    T_ASSERT( e.available.size()==3 );
    return true;
}

static bool test_save_reset_roundtrip(Sandbox& sb)
{
    sb.reset_overrides();
    ProfileStore store(sb.defaults.string(), sb.overrides.string());
    GalleryError e;
    T_ASSERT( store.init(&e) );

    auto def = store.load("panel_a", &e);
    T_ASSERT( def.has_value() );

    SaveResult r;
    T_ASSERT( store.save("panel_a", kPanelCustom, r, &e) );
    auto ov = store.load("panel_a", &e);
    T_ASSERT( ov.has_value() && ov->width()==32 );
    T_ASSERT( store.list()[0].is_custom );

    T_ASSERT( store.reset("panel_a", &e) );
    auto back = store.load("panel_a", &e);
    T_ASSERT( back.has_value() );
    T_ASSERT( back->width()==def->width() && back->height()==def->height() );
    T_ASSERT( back->palette()==def->palette() );
    T_ASSERT( !store.has_override("panel_a") );

    // reset sans override → NotFound
    T_ASSERT( !store.reset("panel_a", &e) && has_kind(e, ErrorKind::NotFound) );

    // reset d’un profil purement custom → NotFound, override conservé
    T_ASSERT( store.save("custom_only", kPanelCustom, r, &e) );
    T_ASSERT( !store.reset("custom_only", &e) && has_kind(e, ErrorKind::NotFound) );
    T_ASSERT( store.has_override("custom_only") );
    return true;
}

static bool test_save_rejects(Sandbox& sb)
{
    sb.reset_overrides();
    ProfileStore store(sb.defaults.string(), sb.overrides.string());
    GalleryError e;
    T_ASSERT( store.init(&e) );
    SaveResult r;

    T_ASSERT( !store.save("a b", kPanelCustom, r, &e) && has_kind(e, ErrorKind::InvalidName) );
    T_ASSERT( !store.save("broken", "{\"resolution\":{}}", r, &e) && has_kind(e, ErrorKind::InvalidConfig) );
    T_ASSERT( !store.has_override("broken") );
    const std::string overflow =
        "{\"resolution\":{\"width\":99999999999999999999,\"height\":10},"
        "\"color_mapping\":{\"palette\":[[0,0,0]]},\"gamma\":1e400}";
    T_ASSERT( !store.save("overflow", overflow, r, &e) && has_kind(e, ErrorKind::InvalidConfig) );
    T_ASSERT( e.message.find("overflow.json")!=std::string::npos );
    T_ASSERT( !store.has_override("overflow") );
    T_ASSERT( !store.import_profile("overflow.json", overflow, true, r, &e) && has_kind(e, ErrorKind::InvalidConfig) );

    // un rejet ne touche pas l’override existant
    T_ASSERT( store.save("keep", kPanelCustom, r, &e) );
    T_ASSERT( !store.save("keep", "garbage", r, &e) );
    auto k = store.load("keep", &e);
    T_ASSERT( k.has_value() && k->width()==32 );

    // aucun fichier temporaire résiduel
    for(const auto& de: fs::directory_iterator(sb.overrides))
    {
        T_ASSERT( de.path().filename().string()[0]!='.' );
    }
    return true;
}

static bool test_duplicate(Sandbox& sb)
{
    sb.reset_overrides();
    ProfileStore store(sb.defaults.string(), sb.overrides.string());
    GalleryError e;
    T_ASSERT( store.init(&e) );
    SaveResult r;

    T_ASSERT( store.duplicate("panel_a", "panel_b", r, &e) );
    T_ASSERT( r.name=="panel_b" && r.is_custom );
    std::string a, b;
    T_ASSERT( store.load_raw("panel_a", a, &e) );
    T_ASSERT( store.load_raw("panel_b", b, &e) );
    T_ASSERT( a==b );               // octets identiques, commentaire compris
    T_ASSERT( b==kPanelA );

    T_ASSERT( !store.duplicate("panel_a", "a b", r, &e) && has_kind(e, ErrorKind::InvalidName) );
    T_ASSERT( !store.duplicate("panel_a", "panel_b", r, &e) && has_kind(e, ErrorKind::AlreadyExists) );
    T_ASSERT( !store.duplicate("ghost", "panel_c", r, &e) && has_kind(e, ErrorKind::NotFound) );
    T_ASSERT( !store.has_override("panel_c") );
    return true;
}

static bool test_delete(Sandbox& sb)
{
    sb.reset_overrides();
    ProfileStore store(sb.defaults.string(), sb.overrides.string());
    GalleryError e;
    T_ASSERT( store.init(&e) );
    SaveResult r;

    T_ASSERT( !store.remove("panel_a", &e) && has_kind(e, ErrorKind::NotFound) );
    T_ASSERT( store.save("tmp_panel", kPanelCustom, r, &e) );
    T_ASSERT( store.remove("tmp_panel", &e) );
    T_ASSERT( !store.load("tmp_panel", &e).has_value() && has_kind(e, ErrorKind::NotFound) );
    // le default reste disponible
    T_ASSERT( store.load("panel_a", &e).has_value() );
    return true;
}

static bool test_import_export(Sandbox& sb)
{
    sb.reset_overrides();
    ProfileStore store(sb.defaults.string(), sb.overrides.string());
    GalleryError e;
    T_ASSERT( store.init(&e) );
    SaveResult r;

    ExportedProfile x;
    T_ASSERT( store.export_profile("panel_a", x, &e) );
    T_ASSERT( x.filename=="panel_a.json" && x.content==kPanelA );
    T_ASSERT( !store.export_profile("ghost", x, &e) && has_kind(e, ErrorKind::NotFound) );

    T_ASSERT( !store.import_profile("new_panel.yaml", kPanelCustom, false, r, &e) && has_kind(e, ErrorKind::InvalidName) );
    T_ASSERT( !store.import_profile("bad name.json", kPanelCustom, false, r, &e) && has_kind(e, ErrorKind::InvalidName) );

    T_ASSERT( store.import_profile("new_panel.json", kPanelCustom, false, r, &e) );
    T_ASSERT( r.name=="new_panel" );

    // second import sans overwrite → AlreadyExists, contenu inchangé
    T_ASSERT( !store.import_profile("new_panel.json", kPanelA, false, r, &e) && has_kind(e, ErrorKind::AlreadyExists) );
    auto p = store.load("new_panel", &e);
    T_ASSERT( p.has_value() && p->width()==32 );

    // avec overwrite → remplacé
    T_ASSERT( store.import_profile("new_panel.json", kPanelA, true, r, &e) );
    p = store.load("new_panel", &e);
    T_ASSERT( p.has_value() && p->width()==64 );

    // contenu invalide → InvalidConfig, override conservé
    T_ASSERT( !store.import_profile("new_panel.json", "{}", true, r, &e) && has_kind(e, ErrorKind::InvalidConfig) );
    p = store.load("new_panel", &e);
    T_ASSERT( p.has_value() && p->width()==64 );

    // import d’un nom présent seulement en default: pas de conflit
    T_ASSERT( store.import_profile("panel_a.json", kPanelCustom, false, r, &e) );
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main()
{
    set_log_level(LogLevel::Warn);
    bool ok = true;

    ok &= test_parse_valid();
    ok &= test_parse_invalid();
    ok &= test_names();
    std::cout << "[A] profile format : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_palette_table();
    std::cout << "[B] palette table : " << (ok? "OK":"FAIL") << "\n";

    Sandbox sb;
    ok &= test_list_and_load(sb);
    ok &= test_save_reset_roundtrip(sb);
    ok &= test_save_rejects(sb);
    ok &= test_duplicate(sb);
    ok &= test_delete(sb);
    ok &= test_import_export(sb);
    std::cout << "[C] profile store : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
