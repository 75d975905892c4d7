#pragma once

#include "machine.hpp"

using PageId = u32;

const u32 PAGE_SIZE = 4096;
const u32 TABLE_MAX_PAGES = 100;

// column widths in bytes
const u32 COLUMN_USERNAME_SIZE = 32;
const u32 COLUMN_EMAIL_SIZE = 255;

const u32 ID_SIZE = sizeof(u32);
const u32 USERNAME_SIZE = COLUMN_USERNAME_SIZE;
const u32 EMAIL_SIZE = COLUMN_EMAIL_SIZE;
const u32 ID_OFFSET = 0;
const u32 USERNAME_OFFSET = ID_OFFSET + ID_SIZE;
const u32 EMAIL_OFFSET = USERNAME_OFFSET + USERNAME_SIZE;
const u32 ROW_SIZE = ID_SIZE + USERNAME_SIZE + EMAIL_SIZE;

const u32 ROWS_PER_PAGE = PAGE_SIZE / ROW_SIZE;
const u32 TABLE_MAX_ROWS = ROWS_PER_PAGE * TABLE_MAX_PAGES;

static_assert(ROW_SIZE == 291);
static_assert(ROWS_PER_PAGE == 14);
// rows never straddle a page boundary
static_assert(ROWS_PER_PAGE * ROW_SIZE <= PAGE_SIZE);
