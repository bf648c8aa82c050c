#pragma once

#include "catalog.h"

// Небольшой учебный каталог: три потока, пять дней по восемь пар,
// обычные и лабораторные курсы, пара ограничений.
CatalogData buildDemoCatalog();
