// config.cpp
#include "config.hpp"
#include "raster.hpp"

#include <cstdlib>
#include <sstream>
#include <vector>

namespace eventposter {

namespace {

// Child lookup that can be chained through missing sections. Missing and
// null children come back undefined so as<T>(fallback) yields the fallback.
YAML::Node child(const YAML::Node& node, const char* key) {
    if (node && node.IsMap()) {
        YAML::Node value = node[key];
        if (value && !value.IsNull()) return value;
    }
    return YAML::Node(YAML::NodeType::Undefined);
}

// Colors are written [R, G, B] or [R, G, B, A]
cv::Scalar loadColor(const YAML::Node& node, const cv::Scalar& default_val) {
    if (!node) return default_val;
    auto c = node.as<std::vector<int>>();
    if (c.size() != 3 && c.size() != 4) {
        throw YAML::Exception(node.Mark(), "color needs 3 or 4 components");
    }
    return raster::rgba(c[0], c[1], c[2], c.size() == 4 ? c[3] : 255);
}

TextStyle loadStyle(const YAML::Node& node, const TextStyle& default_val) {
    TextStyle style = default_val;
    style.size = child(node, "size").as<int>(default_val.size);
    YAML::Node weight = child(node, "weight");
    if (weight) {
        if (!text::parseFontWeight(weight.as<std::string>(), style.weight)) {
            throw YAML::Exception(weight.Mark(), "unknown font weight '" + weight.as<std::string>() + "'");
        }
    }
    return style;
}

bool inRange(double value, double lo, double hi) {
    return value >= lo - 1e-9 && value <= hi + 1e-9;
}

} // namespace

LayoutConfig::LayoutConfig()
    : tint_color(raster::rgba(0, 51, 153, 150)),
      fallback_color(raster::rgba(255, 255, 255)),
      panel_color(raster::rgba(0, 82, 204)),
      border_color(raster::rgba(255, 255, 255, 110)),
      accent_color(raster::rgba(0, 163, 224)),
      text_color(raster::rgba(255, 255, 255)),
      shadow_color(raster::rgba(0, 0, 0, 110)),
      footer_color(raster::rgba(255, 255, 255)),
      separator_color(raster::rgba(200, 200, 200)),
      brand_color(raster::rgba(0, 51, 153)),
      link_color(raster::rgba(0, 122, 204)) {}

cv::Rect LayoutConfig::panelRect() const {
    int w = static_cast<int>(canvas_width * panel_width_ratio);
    int h = static_cast<int>(canvas_height * panel_height_ratio);
    int x = (canvas_width - w) / 2;
    int y = static_cast<int>(canvas_height * panel_top_ratio);
    return cv::Rect(x, y, w, h);
}

cv::Rect LayoutConfig::footerRect() const {
    return cv::Rect(0, canvas_height - footer_height, canvas_width, footer_height);
}

int LayoutConfig::datetimeCenterY() const {
    return panelRect().y + datetime_offset;
}

int LayoutConfig::venueCenterY() const {
    cv::Rect panel = panelRect();
    return panel.y + panel.height - venue_offset;
}

int LayoutConfig::addressCenterY() const {
    cv::Rect panel = panelRect();
    return panel.y + panel.height - address_offset;
}

cv::Rect LayoutConfig::titleBox() const {
    cv::Rect panel = panelRect();
    int top = datetimeCenterY() + datetime.size / 2 + title_gap;
    int bottom = venueCenterY() - venue.size / 2 - title_gap;
    return cv::Rect(panel.x + title_padding_x, top,
                    panel.width - 2 * title_padding_x, bottom - top);
}

bool LayoutConfig::validate(std::string& error) const {
    std::ostringstream ss;

    if (!inRange(panel_width_ratio, 0.80, 0.85)) ss << "panel.width_ratio must be within [0.80, 0.85]; ";
    if (!inRange(panel_height_ratio, 0.50, 0.65)) ss << "panel.height_ratio must be within [0.50, 0.65]; ";
    if (!inRange(panel_top_ratio, 0.14, 0.20)) ss << "panel.top_ratio must be within [0.14, 0.20]; ";
    if (footer_height < 150 || footer_height > 160) ss << "footer.height must be within [150, 160]; ";

    cv::Rect canvas(0, 0, canvas_width, canvas_height);
    cv::Rect panel = panelRect();
    if ((panel & canvas) != panel) ss << "panel exceeds the canvas; ";
    if (panel.y + panel.height > footerRect().y) ss << "panel overlaps the footer; ";

    cv::Rect title_box = titleBox();
    if (title_box.width <= 0 || title_box.height <= 0) ss << "no room left for the title; ";

    if (datetime.size <= 0 || venue.size <= 0 || address.size <= 0 || cta.size <= 0 || link.size <= 0) {
        ss << "font sizes must be positive; ";
    }
    if (title_min_size <= 0 || title_min_size > title.size) ss << "title sizes need 0 < min_size <= start_size; ";
    if (title_size_step < 1) ss << "title.size_step must be at least 1; ";
    if (title_line_spacing < 0) ss << "line spacing must not be negative; ";
    if (blur_radius < 0) ss << "background.blur_radius must not be negative; ";
    if (border_thickness < 0 || accent_thickness < 0 || separator_thickness < 0 || qr_border_thickness < 0) {
        ss << "thicknesses must not be negative; ";
    }
    if (logo_height <= 0 || logo_height > footer_height) ss << "footer.logo_height must fit the footer; ";
    if (qr_size <= 0 || qr_size + 2 * qr_border_margin > footer_height) ss << "footer.qr.size must fit the footer; ";
    if (qr_url.empty()) ss << "footer.qr.url must not be empty; ";

    error = ss.str();
    if (!error.empty()) {
        error.erase(error.size() - 2);  // trailing "; "
        return false;
    }
    return true;
}

bool LayoutConfig::fromYaml(const YAML::Node& node, LayoutConfig& out, std::string& error) {
    LayoutConfig cfg;
    try {
        YAML::Node background = child(node, "background");
        cfg.tint_color = loadColor(child(background, "tint_color"), cfg.tint_color);
        cfg.blur_radius = child(background, "blur_radius").as<int>(cfg.blur_radius);
        cfg.fallback_color = loadColor(child(background, "fallback_color"), cfg.fallback_color);

        YAML::Node panel = child(node, "panel");
        cfg.panel_width_ratio = child(panel, "width_ratio").as<double>(cfg.panel_width_ratio);
        cfg.panel_height_ratio = child(panel, "height_ratio").as<double>(cfg.panel_height_ratio);
        cfg.panel_top_ratio = child(panel, "top_ratio").as<double>(cfg.panel_top_ratio);
        cfg.panel_color = loadColor(child(panel, "color"), cfg.panel_color);
        cfg.border_color = loadColor(child(panel, "border_color"), cfg.border_color);
        cfg.border_thickness = child(panel, "border_thickness").as<int>(cfg.border_thickness);
        cfg.accent_color = loadColor(child(panel, "accent_color"), cfg.accent_color);
        cfg.accent_thickness = child(panel, "accent_thickness").as<int>(cfg.accent_thickness);

        YAML::Node text = child(node, "text");
        cfg.text_color = loadColor(child(text, "color"), cfg.text_color);
        cfg.shadow_color = loadColor(child(text, "shadow_color"), cfg.shadow_color);

        YAML::Node datetime = child(text, "datetime");
        cfg.datetime = loadStyle(datetime, cfg.datetime);
        cfg.datetime_offset = child(datetime, "offset").as<int>(cfg.datetime_offset);
        cfg.datetime_separator = child(datetime, "separator").as<std::string>(cfg.datetime_separator);
        cfg.icon_size = child(datetime, "icon_size").as<int>(cfg.icon_size);
        cfg.icon_gap = child(datetime, "icon_gap").as<int>(cfg.icon_gap);
        cfg.segment_gap = child(datetime, "segment_gap").as<int>(cfg.segment_gap);

        YAML::Node title = child(text, "title");
        cfg.title = loadStyle(title, cfg.title);
        cfg.title.size = child(title, "start_size").as<int>(cfg.title.size);
        cfg.title_min_size = child(title, "min_size").as<int>(cfg.title_min_size);
        cfg.title_size_step = child(title, "size_step").as<int>(cfg.title_size_step);
        cfg.title_line_spacing = child(title, "line_spacing").as<double>(cfg.title_line_spacing);
        cfg.title_padding_x = child(title, "padding_x").as<int>(cfg.title_padding_x);
        cfg.title_gap = child(title, "gap").as<int>(cfg.title_gap);

        YAML::Node venue = child(text, "venue");
        cfg.venue = loadStyle(venue, cfg.venue);
        cfg.venue_offset = child(venue, "offset").as<int>(cfg.venue_offset);

        YAML::Node address = child(text, "address");
        cfg.address = loadStyle(address, cfg.address);
        cfg.address_offset = child(address, "offset").as<int>(cfg.address_offset);

        YAML::Node footer = child(node, "footer");
        cfg.footer_height = child(footer, "height").as<int>(cfg.footer_height);
        cfg.footer_color = loadColor(child(footer, "color"), cfg.footer_color);
        cfg.logo_height = child(footer, "logo_height").as<int>(cfg.logo_height);
        cfg.logo_margin = child(footer, "logo_margin").as<int>(cfg.logo_margin);
        cfg.separator_gap = child(footer, "separator_gap").as<int>(cfg.separator_gap);
        cfg.separator_inset = child(footer, "separator_inset").as<int>(cfg.separator_inset);
        cfg.separator_thickness = child(footer, "separator_thickness").as<int>(cfg.separator_thickness);
        cfg.separator_color = loadColor(child(footer, "separator_color"), cfg.separator_color);
        cfg.cta_text = child(footer, "cta_text").as<std::string>(cfg.cta_text);
        cfg.link_text = child(footer, "link_text").as<std::string>(cfg.link_text);
        cfg.cta = loadStyle(child(footer, "cta"), cfg.cta);
        cfg.link = loadStyle(child(footer, "link"), cfg.link);
        cfg.cta_line_gap = child(footer, "cta_line_gap").as<int>(cfg.cta_line_gap);
        cfg.brand_color = loadColor(child(footer, "brand_color"), cfg.brand_color);
        cfg.link_color = loadColor(child(footer, "link_color"), cfg.link_color);

        YAML::Node qr = child(footer, "qr");
        cfg.qr_url = child(qr, "url").as<std::string>(cfg.qr_url);
        cfg.qr_size = child(qr, "size").as<int>(cfg.qr_size);
        cfg.qr_padding = child(qr, "padding").as<int>(cfg.qr_padding);
        cfg.qr_border_margin = child(qr, "border_margin").as<int>(cfg.qr_border_margin);
        cfg.qr_border_radius = child(qr, "border_radius").as<int>(cfg.qr_border_radius);
        cfg.qr_border_thickness = child(qr, "border_thickness").as<int>(cfg.qr_border_thickness);
    } catch (const YAML::Exception& e) {
        error = std::string("layout config: ") + e.what();
        return false;
    }

    if (!cfg.validate(error)) {
        error = "layout config: " + error;
        return false;
    }
    out = cfg;
    return true;
}

AppConfig::AppConfig() {
    assets.icon_urls = {
        {"clock", "https://img.icons8.com/ios-filled/100/ffffff/clock--v1.png"},
        {"calendar", "https://img.icons8.com/ios-filled/100/ffffff/calendar--v1.png"},
    };
}

bool loadAppConfig(const YAML::Node& root, AppConfig& config, std::string& error) {
    AppConfig cfg;
    if (!LayoutConfig::fromYaml(child(root, "layout"), cfg.layout, error)) {
        return false;
    }

    try {
        YAML::Node assets = child(root, "assets");
        cfg.assets.font_path = child(assets, "font").as<std::string>(cfg.assets.font_path);
        cfg.assets.logo_path = child(assets, "logo").as<std::string>(cfg.assets.logo_path);
        cfg.assets.icon_dir = child(assets, "icon_dir").as<std::string>(cfg.assets.icon_dir);
        YAML::Node icons = child(assets, "icons");
        if (icons && icons.IsMap()) {
            cfg.assets.icon_urls.clear();
            for (const auto& entry : icons) {
                cfg.assets.icon_urls[entry.first.as<std::string>()] = entry.second.as<std::string>();
            }
        }

        YAML::Node search = child(root, "search");
        cfg.search.endpoint = child(search, "endpoint").as<std::string>(cfg.search.endpoint);
        cfg.search.api_key = child(search, "api_key").as<std::string>("");
        cfg.search.per_page = child(search, "per_page").as<int>(cfg.search.per_page);
        cfg.search.orientation = child(search, "orientation").as<std::string>(cfg.search.orientation);
        cfg.search.sort = child(search, "sort").as<std::string>(cfg.search.sort);

        YAML::Node webhook = child(root, "webhook");
        cfg.webhook.url = child(webhook, "url").as<std::string>(cfg.webhook.url);

        YAML::Node http = child(root, "http");
        cfg.http.connect_timeout_ms = child(http, "connect_timeout_ms").as<long>(cfg.http.connect_timeout_ms);
        cfg.http.timeout_ms = child(http, "timeout_ms").as<long>(cfg.http.timeout_ms);
        cfg.http.max_retries = child(http, "max_retries").as<int>(cfg.http.max_retries);
        cfg.http.retry_backoff_ms = child(http, "retry_backoff_ms").as<long>(cfg.http.retry_backoff_ms);
        cfg.http.user_agent = child(http, "user_agent").as<std::string>(cfg.http.user_agent);

        YAML::Node batch = child(root, "batch");
        cfg.batch.variants = child(batch, "variants").as<int>(cfg.batch.variants);
        cfg.batch.max_workers = child(batch, "max_workers").as<int>(cfg.batch.max_workers);
        cfg.batch.derive_queries = child(batch, "derive_queries").as<bool>(cfg.batch.derive_queries);
    } catch (const YAML::Exception& e) {
        error = std::string("config: ") + e.what();
        return false;
    }

    if (cfg.search.api_key.empty()) {
        const char* env_key = std::getenv("PEXELS_API_KEY");
        if (env_key) cfg.search.api_key = env_key;
    }
    if (cfg.search.per_page < 1 || cfg.search.per_page > 80) {
        error = "config: search.per_page must be within [1, 80]";
        return false;
    }
    if (cfg.http.max_retries < 0 || cfg.http.max_retries > 1) {
        error = "config: http.max_retries must be 0 or 1";
        return false;
    }
    if (cfg.http.timeout_ms <= 0 || cfg.http.connect_timeout_ms <= 0) {
        error = "config: http timeouts must be positive";
        return false;
    }
    if (cfg.batch.variants < 1 || cfg.batch.max_workers < 1) {
        error = "config: batch.variants and batch.max_workers must be at least 1";
        return false;
    }

    config = cfg;
    return true;
}

} // namespace eventposter
