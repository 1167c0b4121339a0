// config.hpp
#pragma once

#include "net/http_client.hpp"
#include "text/font.hpp"

#include <opencv2/core.hpp>
#include <yaml-cpp/yaml.h>
#include <map>
#include <string>

namespace eventposter {

struct TextStyle {
    int size = 0;
    text::FontWeight weight = text::FontWeight::Regular;
};

/**
 * Poster geometry, colors and copy. Built once from YAML and passed by
 * const reference into every stage; nothing here changes during a render.
 * Colors are BGRA scalars (see raster::rgba).
 */
struct LayoutConfig {
    // The canvas is always 1080x1080
    int canvas_width = 1080;
    int canvas_height = 1080;

    // Background
    cv::Scalar tint_color;
    int blur_radius = 2;
    cv::Scalar fallback_color;

    // Panel
    double panel_width_ratio = 0.84;
    double panel_height_ratio = 0.58;
    double panel_top_ratio = 0.16;
    cv::Scalar panel_color;
    cv::Scalar border_color;
    int border_thickness = 2;
    cv::Scalar accent_color;
    int accent_thickness = 8;

    // Text
    cv::Scalar text_color;
    cv::Scalar shadow_color;
    TextStyle datetime{40, text::FontWeight::SemiBold};
    int datetime_offset = 72;           // center, below the panel top
    int icon_size = 40;
    int icon_gap = 12;
    int segment_gap = 40;
    std::string datetime_separator = " | ";

    TextStyle title{96, text::FontWeight::Bold};  // size is the starting size
    int title_min_size = 40;
    int title_size_step = 4;
    double title_line_spacing = 0.25;
    int title_padding_x = 48;
    int title_gap = 28;

    TextStyle venue{46, text::FontWeight::SemiBold};
    int venue_offset = 130;             // center, above the panel bottom
    TextStyle address{34, text::FontWeight::Regular};
    int address_offset = 70;

    // Footer
    int footer_height = 150;
    cv::Scalar footer_color;
    int logo_height = 100;
    int logo_margin = 30;
    int separator_gap = 28;
    int separator_inset = 30;
    int separator_thickness = 2;
    cv::Scalar separator_color;
    std::string cta_text = "Reserva tu lugar:";
    std::string link_text = "lu.ma/EXATEC-Alemania";
    TextStyle cta{30, text::FontWeight::SemiBold};
    TextStyle link{30, text::FontWeight::Bold};
    int cta_line_gap = 12;
    cv::Scalar brand_color;
    cv::Scalar link_color;
    std::string qr_url = "https://lu.ma/EXATEC-Alemania";
    int qr_size = 116;
    int qr_padding = 30;
    int qr_border_margin = 6;
    int qr_border_radius = 10;
    int qr_border_thickness = 2;

    LayoutConfig();

    cv::Rect panelRect() const;
    cv::Rect footerRect() const;
    // Box the title block has to fit into
    cv::Rect titleBox() const;
    int datetimeCenterY() const;
    int venueCenterY() const;
    int addressCenterY() const;

    bool validate(std::string& error) const;

    static bool fromYaml(const YAML::Node& node, LayoutConfig& out, std::string& error);
};

struct AssetConfig {
    std::string font_path = "assets/fonts/Montserrat-VariableFont_wght.ttf";
    std::string logo_path = "assets/logo.png";
    std::string icon_dir = "assets/icons";
    std::map<std::string, std::string> icon_urls;
};

struct SearchConfig {
    std::string endpoint = "https://api.pexels.com/v1/search";
    std::string api_key;
    int per_page = 15;
    std::string orientation = "square";
    std::string sort = "popular";
};

struct WebhookConfig {
    std::string url;
};

struct BatchConfig {
    int variants = 5;
    int max_workers = 5;
    bool derive_queries = true;
};

struct AppConfig {
    LayoutConfig layout;
    AssetConfig assets;
    SearchConfig search;
    WebhookConfig webhook;
    net::HttpOptions http;
    BatchConfig batch;

    AppConfig();
};

// Missing keys keep their defaults. Fails on malformed values or invalid
// geometry.
bool loadAppConfig(const YAML::Node& root, AppConfig& config, std::string& error);

} // namespace eventposter
