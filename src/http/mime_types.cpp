#include "http/mime_types.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace gzs::http {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

// Types shipped with the Flashpoint proxy settings
const std::unordered_map<std::string, std::string> kLegacyTypes = {
    {"aab", "application/x-authorware-bin"},
    {"aam", "application/x-authorware-map"},
    {"aas", "application/x-authorware-seg"},
    {"afl", "video/animaflex"},
    {"aif", "audio/aiff"},
    {"aifc", "audio/aiff"},
    {"aiff", "audio/aiff"},
    {"asd", "application/astound"},
    {"asmx", "text/xml"},
    {"asn", "application/astound"},
    {"au", "audio/basic"},
    {"aut", "application/pbautomation"},
    {"aw3", "application/x-awingsoft-winds3d"},
    {"axs", "application/x-MindAvenueAXELStream"},
    {"blend", "application/x-burster"},
    {"blendz", "application/x-burster"},
    {"blz", "video/blz"},
    {"bswrl", "application/x-bscontact"},
    {"bub", "application/photobubble"},
    {"bxwrl", "application/x-blaxxuncc3d"},
    {"ccn", "application/x-cnc"},
    {"cct", "application/x-director"},
    {"cdx", "chemical/x-cdx"},
    {"cgm", "image/cgm"},
    {"chm", "chemical/x-chemdraw"},
    {"cit", "image/cit"},
    {"class", "application/java"},
    {"cmo", "application/x-virtools"},
    {"cnc", "application/x-cnc"},
    {"co", "application/x-cult3d-object"},
    {"cow", "chemical/x-cow"},
    {"csm", "chemical/x-csml"},
    {"csml", "chemical/x-csml"},
    {"css", "text/css"},
    {"cst", "application/x-director"},
    {"cub", "chemical/x-gaussian-cube"},
    {"cube", "chemical/x-gaussian-cube"},
    {"cxt", "application/x-director"},
    {"d96", "x-world/x-d96"},
    {"dae", "model/x-bs-collada+xml"},
    {"dcr", "application/x-director"},
    {"deepv", "application/x-deepv"},
    {"dgn", "image/dgn"},
    {"dir", "application/x-director"},
    {"djvu", "image/vnd.djvu"},
    {"dpg", "application/vnd.dpgraph"},
    {"dpgraph", "application/vnd.dpgraph"},
    {"dsn", "application/x-altiadsn"},
    {"dvl", "application/x-devalvrx"},
    {"dx", "chemical/x-jcamp-dx"},
    {"dxr", "application/x-director"},
    {"elec", "application/x-electrifier"},
    {"emb", "chemical/x-pdb"},
    {"embl", "chemical/x-pdb"},
    {"eva", "application/x-eva"},
    {"evy", "application/envoy"},
    {"fh4", "image/x-freehand4"},
    {"fh5", "image/x-freehand5"},
    {"fh7", "image/x-freehand7"},
    {"fhc", "image/x-freehand"},
    {"gau", "chemical/x-gaussian-input"},
    {"gz", "application/x-gzip-compressed"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"ips", "application/x-ipscript"},
    {"ipx", "application/x-ipix"},
    {"it", "audio/it"},
    {"itz", "audio/x-zipped-it"},
    {"jar", "application/java-archive"},
    {"jdx", "chemical/x-jcamp-dx"},
    {"jp2", "image/jp2"},
    {"jp2k", "image/jp2"},
    {"js", "text/javascript"},
    {"json", "application/json"},
    {"mcf", "image/vasa"},
    {"mdz", "audio/x-zipped-mod"},
    {"med", "audio/x-mod"},
    {"mid", "audio/mid"},
    {"midi", "audio/midi"},
    {"mjs", "text/javascript"},
    {"mod", "audio/mod"},
    {"mol", "chemical/x-mdl-molfile"},
    {"mop", "chemical/x-mopac-input"},
    {"mov", "video/quicktime"},
    {"mus", "x-world/x-d96"},
    {"mwc", "application/vnd.dpgraph"},
    {"mwf", "application/x-mwf"},
    {"nmo", "application/x-virtools"},
    {"nms", "application/x-virtools"},
    {"p3d", "application/x-p3d"},
    {"pdb", "chemical/x-pdb"},
    {"pqf", "application/x-cprplayer"},
    {"pqi", "application/cprplayer"},
    {"pw3", "application/x-pulse-player-32"},
    {"pwc", "application/x-pulse-player"},
    {"pwn", "application/x-pulse-download"},
    {"pws", "application/x-pulse-stream"},
    {"qdgx", "image/x-qdgx"},
    {"rbs", "x-world/realibase"},
    {"rle", "image/rle"},
    {"rxn", "chemical/x-mdl-rxnfile"},
    {"s3m", "audio/s3m"},
    {"s3z", "audio/x-mod"},
    {"sca", "application/x-supercard"},
    {"scr", "application/x-rasmol"},
    {"sid", "audio/x-sidtune"},
    {"skc", "chemical/x-mdl-tgf"},
    {"smp", "application/studiom"},
    {"spl", "application/futuresplash"},
    {"sts", "application/x-squeak-source"},
    {"svf", "vector/x-svf"},
    {"svg", "image/svg+xml"},
    {"svgz", "image/svg+xml"},
    {"svr", "x-world/x-svr"},
    {"swa", "application/x-director"},
    {"swf", "application/x-shockwave-flash"},
    {"tbk", "application/toolbook"},
    {"tcl", "application/x-tcl"},
    {"tgf", "chemical/x-mdl-tgf"},
    {"thp", "plugin/x-theorist"},
    {"tv", "application/x-alambik-script"},
    {"tvb", "application/x-alambik-script"},
    {"tvd", "application/x-alambik-script"},
    {"tvs", "application/x-alambik-script"},
    {"tvv", "application/x-alambik-script"},
    {"twf", "image/x-twf"},
    {"twfz", "image/x-twf-zlib-compressed"},
    {"unity3d", "application/vnd.unity"},
    {"vec", "image/vec"},
    {"vmo", "application/x-virtools"},
    {"vobj", "application/x-netscape-vae-plugin-vae"},
    {"vrt", "x-world/x-vrt"},
    {"w3d", "application/x-director"},
    {"wasm", "application/wasm"},
    {"wav", "audio/wav"},
    {"web", "application/vnd.xara"},
    {"wrl", "model/vrml"},
    {"wrz", "application/x-gzip-compressed"},
    {"wvr", "x-world/x-wvr"},
    {"x3db", "model/x3d+binary"},
    {"x3dz", "application/x-gzip-compressed"},
    {"xap", "application/x-silverlight-app"},
    {"xar", "application/vnd.xara"},
    {"xm", "audio/xm"},
    {"xml", "application/xml"},
    {"xmz", "audio/x-mod"},
    {"xpg", "text/x-xpg"},
    {"xvr", "x-world/x-xvr"},
    {"xyz", "chemical/x-xyz"},
};

const std::unordered_map<std::string, std::string> kStandardTypes = {
    {"txt", "text/plain"},
    {"csv", "text/csv"},
    {"png", "image/png"},
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"gif", "image/gif"},
    {"bmp", "image/bmp"},
    {"ico", "image/x-icon"},
    {"webp", "image/webp"},
    {"mp3", "audio/mpeg"},
    {"ogg", "audio/ogg"},
    {"oga", "audio/ogg"},
    {"mp4", "video/mp4"},
    {"webm", "video/webm"},
    {"ogv", "video/ogg"},
    {"avi", "video/x-msvideo"},
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"ttf", "font/ttf"},
    {"otf", "font/otf"},
    {"eot", "application/vnd.ms-fontobject"},
    {"zip", "application/zip"},
    {"rar", "application/x-rar-compressed"},
    {"7z", "application/x-7z-compressed"},
    {"tar", "application/x-tar"},
    {"pdf", "application/pdf"},
    {"doc", "application/msword"},
    {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {"xls", "application/vnd.ms-excel"},
    {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {"ppt", "application/vnd.ms-powerpoint"},
    {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
    {"bin", "application/octet-stream"},
    {"exe", "application/octet-stream"},
    {"dll", "application/octet-stream"},
};

} // namespace

std::string mime_type_for_extension(std::string_view extension) {
    auto ext = to_lower(extension);

    if (auto it = kLegacyTypes.find(ext); it != kLegacyTypes.end()) {
        return it->second;
    }
    if (auto it = kStandardTypes.find(ext); it != kStandardTypes.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

std::string file_extension(std::string_view path) {
    auto slash = path.rfind('/');
    auto name = slash == std::string_view::npos ? path : path.substr(slash + 1);
    auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == name.size()) {
        return {};
    }
    return to_lower(name.substr(dot + 1));
}

bool is_script_extension(std::string_view extension) {
    auto ext = to_lower(extension);
    return ext == "php" || ext == "php5" || ext == "phtml" || ext == "pl";
}

} // namespace gzs::http
