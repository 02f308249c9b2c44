#pragma once

int cmd_scrape(int argc, char** argv);
int cmd_exec(int argc, char** argv);
int cmd_check(int argc, char** argv);
int cmd_policy(int argc, char** argv);
