/* This program is free software. It comes without any warranty, to
 * the extent permitted by applicable law. You can redistribute it
 * and/or modify it under the terms of the Do What The Fuck You Want
 * To Public License, Version 2, as published by Sam Hocevar. See
 * http://www.wtfpl.net/ for more details. */

#include <gtest/gtest.h>
#include <curl/curl.h>
#include <rhash.h>

int main(int argc, char **argv)
{
    rhash_library_init();
    curl_global_init(CURL_GLOBAL_ALL);

    ::testing::InitGoogleTest(&argc, argv);
    int res = RUN_ALL_TESTS();

    curl_global_cleanup();
    return res;
}
