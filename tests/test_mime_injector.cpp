#include <catch2/catch_test_macros.hpp>

#include "http/html_injector.hpp"
#include "http/mime_types.hpp"

using namespace gzs::http;

TEST_CASE("MIME lookup prefers legacy plugin types", "[http]") {
    CHECK(mime_type_for_extension("swf") == "application/x-shockwave-flash");
    CHECK(mime_type_for_extension("SWF") == "application/x-shockwave-flash");
    CHECK(mime_type_for_extension("dcr") == "application/x-director");
    CHECK(mime_type_for_extension("unity3d") == "application/vnd.unity");
    CHECK(mime_type_for_extension("wrl") == "model/vrml");
    CHECK(mime_type_for_extension("html") == "text/html");
    CHECK(mime_type_for_extension("png") == "image/png");
    CHECK(mime_type_for_extension("txt") == "text/plain");
}

TEST_CASE("Unknown extensions are served as octet-stream", "[http]") {
    CHECK(mime_type_for_extension("definitelynotatype") == "application/octet-stream");
    CHECK(mime_type_for_extension("") == "application/octet-stream");
}

TEST_CASE("Extension of a URL path", "[http]") {
    CHECK(file_extension("/a/b/Game.SWF") == "swf");
    CHECK(file_extension("index.html") == "html");
    CHECK(file_extension("/a.b/c") == "");
    CHECK(file_extension("/a/b.") == "");
    CHECK(file_extension("") == "");
}

TEST_CASE("Script extensions", "[http]") {
    CHECK(is_script_extension("php"));
    CHECK(is_script_extension("PHP"));
    CHECK(is_script_extension("php5"));
    CHECK(is_script_extension("phtml"));
    CHECK(is_script_extension("pl"));
    CHECK_FALSE(is_script_extension("html"));
    CHECK_FALSE(is_script_extension(""));
}

// ================================================================
// Polyfill injection
// ================================================================

TEST_CASE("General polyfills go right after <head>", "[http]") {
    std::string html = "<html><head><title>x</title></head><body></body></html>";
    auto out = inject_polyfills(html);

    auto head = out.find("<head>");
    auto script = out.find("<script>");
    auto title = out.find("<title>");
    REQUIRE(head != std::string::npos);
    REQUIRE(script != std::string::npos);
    CHECK(head < script);
    CHECK(script < title);
    CHECK(out.find("window.external") != std::string::npos);
    CHECK(out.find("UnityProgress") == std::string::npos);
}

TEST_CASE("Head tag with attributes", "[http]") {
    auto out = inject_polyfills("<html><HEAD profile=\"x\"></HEAD></html>");
    CHECK(out.rfind("<html><HEAD profile=\"x\">\n<script>", 0) == 0);
}

TEST_CASE("Unity pages get the Unity shims too", "[http]") {
    std::string html =
        "<html><head></head><body>"
        "<script src=\"Build/game.loader.js\"></script></body></html>";
    CHECK(needs_unity_polyfills(html));

    auto out = inject_polyfills(html);
    CHECK(out.find("createUnityInstance") != std::string::npos);
    CHECK(out.find("window.external") != std::string::npos);
    // Unity shims come first
    CHECK(out.find("UnityProgress") < out.find("window.external"));

    CHECK(needs_unity_polyfills("var u = new unityloader();"));
    CHECK_FALSE(needs_unity_polyfills("<html><body>flash</body></html>"));
}

TEST_CASE("Missing head is created after <html>", "[http]") {
    auto out = inject_polyfills("<html lang=\"en\"><body>hi</body></html>");
    CHECK(out.rfind("<html lang=\"en\"><head>\n<script>", 0) == 0);
    CHECK(out.find("</script>\n</head><body>hi</body></html>") != std::string::npos);

    // <header> is not <head>
    auto header = inject_polyfills("<html><header>x</header></html>");
    CHECK(header.rfind("<html><head>", 0) == 0);
}

TEST_CASE("Non-HTML content is returned untouched", "[http]") {
    CHECK(inject_polyfills("just some text") == "just some text");
    CHECK(inject_polyfills("") == "");
    // Marker check is case-sensitive
    CHECK(inject_polyfills("<HTML><BODY></BODY></HTML>") == "<HTML><BODY></BODY></HTML>");
}

TEST_CASE("Large single-line pages are injected without backtracking", "[http]") {
    std::string html = "<html><head></head><body><script src=\"Build/";
    html.append(1024 * 1024, 'a');
    html += ".loader.js\"></script></body></html>";

    CHECK(needs_unity_polyfills(html));
    auto out = inject_polyfills(html);
    CHECK(out.rfind("<html><head>\n<script>", 0) == 0);
    CHECK(out.find("createUnityInstance") != std::string::npos);
    CHECK(out.size() > html.size());

    std::string plain = "<html><body>";
    plain.append(1024 * 1024, 'x');
    plain += "</body></html>";
    auto plain_out = inject_polyfills(plain);
    CHECK(plain_out.rfind("<html><head>\n<script>", 0) == 0);
    CHECK(plain_out.find("UnityProgress") == std::string::npos);
}

TEST_CASE("Build loader must sit on one line", "[http]") {
    CHECK(needs_unity_polyfills("src=\"BUILD/web.Loader.JS\""));
    CHECK_FALSE(needs_unity_polyfills("see Build/\nweb.loader.js"));
    CHECK_FALSE(needs_unity_polyfills("build/ only"));
    CHECK(needs_unity_polyfills("Build/x\nBuild/y.loader.js"));
}
