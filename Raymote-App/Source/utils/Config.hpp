#pragma once
#include <string>

struct HttpConfig {
    std::string host = "0.0.0.0";
    int port = 3000;
    bool cors = false;
    unsigned maxEventStreams = 8; // stream /api/events aperti insieme
};

struct FilesConfig {
    std::string portConfig = "./config.json";  // porte salvate (receiverPort/transmitterPort)
    std::string buttons = "./buttons.json";
    std::string publicDir = "./public";        // pagina web statica, se presente
};

struct AppConfig {
    HttpConfig http;
    FilesConfig files;
    unsigned keepaliveSeconds = 30;
};
