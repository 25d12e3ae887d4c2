#pragma once

namespace mockprom {

const char* admin_page_html();

}
