)pbtext";

const char ROCONFIG_PROTO_TEXT_REGTEST[] = R"pbtext(
