// src/common/Constants.cpp
#include "transread/common/Constants.hpp"

const char* transread::common::Constants::DEFAULT_USER_AGENT = "transread/1.0";

const char* transread::common::Constants::SUFFIX_TAR_GZIP = ".tar.gz";
const char* transread::common::Constants::SUFFIX_TAR_BZIP2 = ".tar.bz2";
const char* transread::common::Constants::SUFFIX_TGZ = ".tgz";
const char* transread::common::Constants::SUFFIX_GZIP = ".gz";
const char* transread::common::Constants::SUFFIX_BZIP2 = ".bz2";
